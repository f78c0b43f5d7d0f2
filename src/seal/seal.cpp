/**
 * @file seal.cpp
 * @brief Реализация кодировщика seal v1
 */

#include "seal.hpp"
#include "../core/constants.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/keccak256.hpp"

#include <format>
#include <string_view>

namespace sealchain::seal {

namespace {

Result<void> check_length(std::string_view field, const std::string& value, std::size_t max) {
    if (value.size() > max) {
        return Err<void>(
            ErrorCode::SealFieldTooLong,
            std::format("{} превышает {} байт: {}", field, max, value.size())
        );
    }
    return {};
}

} // anonymous namespace

Result<void> validate_seal_inputs(const SealParams& params) {
    if (params.value_decimals > constants::MAX_VALUE_DECIMALS) {
        return Err<void>(
            ErrorCode::SealInvalidDecimals,
            std::format("value_decimals должен быть 0-{}: {}",
                        constants::MAX_VALUE_DECIMALS, params.value_decimals)
        );
    }
    
    if (params.score && *params.score > constants::MAX_SCORE) {
        return Err<void>(
            ErrorCode::SealInvalidScore,
            std::format("score должен быть 0-{}: {}", constants::MAX_SCORE, *params.score)
        );
    }
    
    if (auto r = check_length("tag1", params.tag1, constants::MAX_TAG_LEN); !r) return r;
    if (auto r = check_length("tag2", params.tag2, constants::MAX_TAG_LEN); !r) return r;
    if (auto r = check_length("endpoint", params.endpoint, constants::MAX_ENDPOINT_LEN); !r) return r;
    return check_length("feedback_uri", params.feedback_uri, constants::MAX_URI_LEN);
}

Result<Bytes> encode_seal_preimage(const SealParams& params) {
    if (auto valid = validate_seal_inputs(params); !valid) {
        return std::unexpected(valid.error());
    }
    
    const std::size_t dynamic_size =
        (params.feedback_file_hash ? constants::DIGEST_SIZE : 0) +
        8 + params.tag1.size() + params.tag2.size() +
        params.endpoint.size() + params.feedback_uri.size();
    
    core::serialization::WriteStream stream(constants::SEAL_FIXED_SIZE + dynamic_size);
    
    // === Фиксированная часть ===
    stream.write_bytes(constants::DOMAIN_SEAL_V1);
    stream.write_i64_le(params.value);
    stream.write_u8(params.value_decimals);
    if (params.score) {
        stream.write_u8(1);
        stream.write_u8(*params.score);
    } else {
        stream.write_u8(0);
        stream.write_u8(0);
    }
    stream.write_u8(params.feedback_file_hash ? 1 : 0);
    
    // === Динамическая часть ===
    if (params.feedback_file_hash) {
        stream.write_hash256(*params.feedback_file_hash);
    }
    stream.write_string_u16(params.tag1);
    stream.write_string_u16(params.tag2);
    stream.write_string_u16(params.endpoint);
    stream.write_string_u16(params.feedback_uri);
    
    return stream.take_data();
}

Result<Digest> compute_seal_hash(const SealParams& params) {
    auto preimage = encode_seal_preimage(params);
    if (!preimage) {
        return std::unexpected(preimage.error());
    }
    return crypto::keccak256(ByteSpan{preimage->data(), preimage->size()});
}

Result<bool> verify_seal_hash(const SealParams& params, const Digest& expected) {
    auto computed = compute_seal_hash(params);
    if (!computed) {
        return std::unexpected(computed.error());
    }
    return *computed == expected;
}

} // namespace sealchain::seal
