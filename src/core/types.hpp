/**
 * @file types.hpp
 * @brief Базовые типы для sealchain
 * 
 * Определяет основные типы данных, используемые во всём проекте:
 * - Digest: 32-байтный Keccak-256 дайджест (seal hash, leaf, running digest)
 * - Pubkey: 32-байтный идентификатор Solana (asset, client, responder)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealchain {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный дайджест (32 байта)
 * 
 * Используется для:
 * - Keccak-256 хешей
 * - seal hash отзыва
 * - листьев (leaf) и бегущих дайджестов цепочек
 */
using Hash256 = std::array<uint8_t, 32>;

/// @brief Синоним Hash256 для дайджестов хеш-цепочек
using Digest = Hash256;

/**
 * @brief Публичный ключ Solana (32 байта)
 * 
 * Фиксированный размер делает невозможным передачу идентификатора
 * некорректной длины в кодировщики листьев.
 */
using Pubkey = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/// @brief Нулевой дайджест: начальное состояние каждой цепочки
inline constexpr Digest ZERO_DIGEST{};

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 * 
 * Ошибки возвращаются через Result<T>, исключения не пересекают
 * границы модулей.
 */
enum class ErrorCode {
    Success = 0,
    
    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,
    
    // Ошибки сети (200-299)
    NetworkTimeout = 201,
    
    // Ошибки индексатора (300-399)
    IndexerUnavailable = 300,
    IndexerUnauthorized = 301,
    IndexerRateLimited = 302,
    IndexerInvalidResponse = 303,
    IndexerHttpError = 304,
    
    // Ошибки on-chain источника (400-499)
    OnChainUnavailable = 400,
    OnChainInvalidData = 401,
    
    // Ошибки seal и кодирования (500-599)
    SealInvalidDecimals = 500,
    SealInvalidScore = 501,
    SealFieldTooLong = 502,
    EncodingInvalidHex = 510,
    EncodingInvalidBase58 = 511,
    EncodingInvalidLength = 512,
    
    // Ошибки проверки целостности (800-899)
    IntegrityAgentNotFound = 800,
    IntegrityNegativeLag = 801,
    IntegrityCountRegression = 802,
    
    // Системные ошибки (900-999)
    SystemInternal = 901,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::IndexerUnavailable: return "Индексатор недоступен";
        case ErrorCode::IndexerUnauthorized: return "Ошибка авторизации индексатора";
        case ErrorCode::IndexerRateLimited: return "Превышен лимит запросов индексатора";
        case ErrorCode::IndexerInvalidResponse: return "Некорректный ответ индексатора";
        case ErrorCode::IndexerHttpError: return "HTTP ошибка индексатора";
        case ErrorCode::OnChainUnavailable: return "On-chain источник недоступен";
        case ErrorCode::OnChainInvalidData: return "Некорректные on-chain данные";
        case ErrorCode::SealInvalidDecimals: return "decimals вне диапазона 0-6";
        case ErrorCode::SealInvalidScore: return "score вне диапазона 0-100";
        case ErrorCode::SealFieldTooLong: return "Поле seal превышает максимальную длину";
        case ErrorCode::EncodingInvalidHex: return "Некорректная hex строка";
        case ErrorCode::EncodingInvalidBase58: return "Некорректная base58 строка";
        case ErrorCode::EncodingInvalidLength: return "Некорректная длина данных";
        case ErrorCode::IntegrityAgentNotFound: return "Агент не найден on-chain";
        case ErrorCode::IntegrityNegativeLag: return "Индексатор опережает on-chain состояние";
        case ErrorCode::IntegrityCountRegression: return "On-chain счётчик уменьшился";
        case ErrorCode::SystemInternal: return "Внутренняя ошибка";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 */
struct Error {
    ErrorCode code;
    std::string message;
    
    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}
    
    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept 
        : code(c), message(std::move(msg)) {}
    
    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 * 
 * @tparam T Тип возвращаемого значения
 * 
 * Пример использования:
 * @code
 * auto hash = seal::compute_seal_hash(params);
 * if (!hash) {
 *     std::cerr << hash.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Concepts для type constraints
// =============================================================================

/**
 * @brief Concept для байтовых контейнеров
 */
template<typename T>
concept ByteContainer = requires(T t) {
    { t.data() } -> std::convertible_to<const uint8_t*>;
    { t.size() } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Получить ByteSpan для любого байтового контейнера
 */
template<ByteContainer T>
[[nodiscard]] constexpr ByteSpan as_bytes(const T& container) noexcept {
    return ByteSpan{container.data(), container.size()};
}

/**
 * @brief Получить ByteSpan на байты UTF-8 строки
 */
[[nodiscard]] inline ByteSpan as_bytes(std::string_view str) noexcept {
    return ByteSpan{reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

} // namespace sealchain
