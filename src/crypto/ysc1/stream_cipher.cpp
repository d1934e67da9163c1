/**
 * @file stream_cipher.cpp
 * @brief YSC1 stream layer: C ABI and C++ wrapper
 *
 * Buffers the unused tail of the last keystream block so that arbitrary
 * chunking of ysc1_crypt calls yields the same stream, and supports
 * block- and byte-granular seeking.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ysc1/crypto/stream_cipher.h"
#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/security.h"

#include <cstring>
#include <limits>
#include <string>

using ysc1::internal::VariantParams;
using ysc1::internal::KeystreamBlockFn;

namespace {

constexpr uint64_t COUNTER_MAX = std::numeric_limits<uint64_t>::max();

inline bool ctx_ready(const ysc1_ctx_t* ctx) {
    return ctx != nullptr && ctx->initialized;
}

/**
 * @brief Advance the counter and produce the next block into ctx->keystream
 *
 * The caller has already checked that the counter has room.
 */
inline void next_block(ysc1_ctx_t* ctx, uint8_t out[YSC1_BLOCK_SIZE]) {
    KeystreamBlockFn fn = ysc1::internal::backend_fn(ctx->backend);
    ctx->state[YSC1_COUNTER_WORD] += 1;
    fn(ctx->state, ctx->state[YSC1_COUNTER_WORD], ctx->keystream_rounds, out);
}

inline void xor_bytes(uint8_t* out, const uint8_t* in, const uint8_t* ks, size_t len) {
    for (size_t i = 0; i < len; i++) {
        out[i] = static_cast<uint8_t>(in[i] ^ ks[i]);
    }
}

ysc1_error_t mark_exhausted(ysc1_ctx_t* ctx) {
    ctx->exhausted = 1;
    ctx->remaining = 0;
    ysc1_secure_zero(ctx->keystream, sizeof(ctx->keystream));
    return YSC1_ERROR_COUNTER_EXHAUSTED;
}

} // anonymous namespace

extern "C" {

ysc1_error_t ysc1_init_with_backend(
    ysc1_ctx_t* ctx,
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len,
    ysc1_backend_t backend
) {
    if (!ctx || !key || !nonce) {
        return YSC1_ERROR_INVALID_PARAM;
    }

    const VariantParams* params = ysc1::internal::find_variant(variant);
    if (!params) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    if (key_len != params->key_words * 8) {
        return YSC1_ERROR_INVALID_KEY;
    }
    if (nonce_len != params->nonce_words * 8) {
        return YSC1_ERROR_INVALID_NONCE;
    }
    if (!ysc1::internal::backend_available(backend)) {
        return YSC1_ERROR_NOT_SUPPORTED;
    }

    std::memset(ctx, 0, sizeof(*ctx));
    ysc1::internal::key_schedule(*params, key, nonce, ctx->state);

    // The init rounds leave word 12 mixed; the block counter starts at 0
    ctx->state[YSC1_COUNTER_WORD] = 0;

    ctx->keystream_rounds = params->keystream_rounds;
    ctx->variant = static_cast<int>(params->variant);
    ctx->backend = backend == YSC1_BACKEND_AUTO
        ? static_cast<int>(ysc1::internal::probe_backend())
        : static_cast<int>(backend);
    ctx->remaining = 0;
    ctx->exhausted = 0;
    ctx->initialized = 1;

    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_init(
    ysc1_ctx_t* ctx,
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len
) {
    return ysc1_init_with_backend(ctx, variant, key, key_len, nonce, nonce_len,
                                  YSC1_BACKEND_AUTO);
}

ysc1_error_t ysc1_crypt(
    ysc1_ctx_t* ctx,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
) {
    if (!ctx_ready(ctx)) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    if (input_len > 0 && (!input || !output)) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    if (ctx->exhausted) {
        return YSC1_ERROR_COUNTER_EXHAUSTED;
    }
    if (input_len == 0) {
        return YSC1_SUCCESS;
    }

    // Fail before writing anything if the counter cannot cover the request
    if (input_len > ctx->remaining) {
        const uint64_t need = static_cast<uint64_t>(input_len - ctx->remaining);
        const uint64_t blocks = need / YSC1_BLOCK_SIZE + (need % YSC1_BLOCK_SIZE != 0 ? 1 : 0);
        if (blocks > COUNTER_MAX - ctx->state[YSC1_COUNTER_WORD]) {
            return mark_exhausted(ctx);
        }
    }

    size_t offset = 0;

    // Use remaining keystream from the previous call
    if (ctx->remaining > 0) {
        size_t use = YSC1_MIN(ctx->remaining, input_len);
        size_t ks_offset = YSC1_BLOCK_SIZE - ctx->remaining;
        xor_bytes(output, input, ctx->keystream + ks_offset, use);
        ctx->remaining -= use;
        offset = use;
    }

    // Full blocks
    uint8_t block[YSC1_BLOCK_SIZE];
    while (input_len - offset >= YSC1_BLOCK_SIZE) {
        next_block(ctx, block);
        xor_bytes(output + offset, input + offset, block, YSC1_BLOCK_SIZE);
        offset += YSC1_BLOCK_SIZE;
    }
    ysc1_secure_zero(block, sizeof(block));

    // Trailing partial block, keep its tail for the next call
    if (offset < input_len) {
        next_block(ctx, ctx->keystream);
        size_t tail = input_len - offset;
        xor_bytes(output + offset, input + offset, ctx->keystream, tail);
        ctx->remaining = YSC1_BLOCK_SIZE - tail;
    }

    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_keystream_block(ysc1_ctx_t* ctx, uint8_t out[64]) {
    if (!ctx_ready(ctx) || !out) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    if (ctx->exhausted) {
        return YSC1_ERROR_COUNTER_EXHAUSTED;
    }
    if (ctx->state[YSC1_COUNTER_WORD] == COUNTER_MAX) {
        return mark_exhausted(ctx);
    }

    ctx->remaining = 0;
    ysc1_secure_zero(ctx->keystream, sizeof(ctx->keystream));
    next_block(ctx, out);
    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_get_block_pos(const ysc1_ctx_t* ctx, uint64_t* pos) {
    if (!ctx_ready(ctx) || !pos) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    *pos = ctx->state[YSC1_COUNTER_WORD];
    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_set_block_pos(ysc1_ctx_t* ctx, uint64_t pos) {
    if (!ctx_ready(ctx)) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    if (ctx->exhausted) {
        return YSC1_ERROR_COUNTER_EXHAUSTED;
    }

    ctx->state[YSC1_COUNTER_WORD] = pos;
    ctx->remaining = 0;
    ysc1_secure_zero(ctx->keystream, sizeof(ctx->keystream));
    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_get_byte_pos(const ysc1_ctx_t* ctx, uint64_t* pos) {
    if (!ctx_ready(ctx) || !pos) {
        return YSC1_ERROR_INVALID_PARAM;
    }

    const uint64_t counter = ctx->state[YSC1_COUNTER_WORD];
    if (ctx->remaining == 0) {
        if (counter > COUNTER_MAX / YSC1_BLOCK_SIZE) {
            return YSC1_ERROR_INVALID_PARAM;
        }
        *pos = counter * YSC1_BLOCK_SIZE;
        return YSC1_SUCCESS;
    }

    // A buffered tail implies counter >= 1: pos = (counter - 1) * 64 + used
    const uint64_t used = YSC1_BLOCK_SIZE - ctx->remaining;
    const uint64_t full = counter - 1;
    if (full > (COUNTER_MAX - used) / YSC1_BLOCK_SIZE) {
        return YSC1_ERROR_INVALID_PARAM;
    }
    *pos = full * YSC1_BLOCK_SIZE + used;
    return YSC1_SUCCESS;
}

ysc1_error_t ysc1_seek_bytes(ysc1_ctx_t* ctx, uint64_t pos) {
    ysc1_error_t err = ysc1_set_block_pos(ctx, pos / YSC1_BLOCK_SIZE);
    if (err != YSC1_SUCCESS) {
        return err;
    }

    const size_t within = static_cast<size_t>(pos % YSC1_BLOCK_SIZE);
    if (within != 0) {
        // pos / 64 < 2^58, so the counter cannot run out here
        next_block(ctx, ctx->keystream);
        ctx->remaining = YSC1_BLOCK_SIZE - within;
    }
    return YSC1_SUCCESS;
}

ysc1_backend_t ysc1_get_backend(const ysc1_ctx_t* ctx) {
    if (!ctx_ready(ctx)) {
        return YSC1_BACKEND_AUTO;
    }
    return static_cast<ysc1_backend_t>(ctx->backend);
}

const char* ysc1_backend_name(ysc1_backend_t backend) {
    switch (backend) {
        case YSC1_BACKEND_AUTO: return "auto";
        case YSC1_BACKEND_SOFT: return "soft";
        case YSC1_BACKEND_SSE2: return "sse2";
        case YSC1_BACKEND_AVX2: return "avx2";
        default: return "unknown";
    }
}

int ysc1_backend_available(ysc1_backend_t backend) {
    return ysc1::internal::backend_available(backend) ? 1 : 0;
}

void ysc1_clear(ysc1_ctx_t* ctx) {
    if (ctx) {
        ysc1_secure_zero(ctx, sizeof(*ctx));
    }
}

ysc1_error_t ysc1_xor(
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
) {
    ysc1_ctx_t ctx;
    ysc1_error_t err = ysc1_init(&ctx, variant, key, key_len, nonce, nonce_len);
    if (err != YSC1_SUCCESS) {
        return err;
    }

    err = ysc1_crypt(&ctx, input, input_len, output);
    ysc1_clear(&ctx);
    return err;
}

} // extern "C"

// ============================================================================
// C++ Wrapper
// ============================================================================

namespace ysc1 {

void throw_error(ysc1_error_t code, const char* context) {
    if (code == YSC1_ERROR_COUNTER_EXHAUSTED) {
        throw CounterExhaustedError();
    }
    throw Error(code, std::string(context) + ": " + ysc1_error_string(code));
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::init(const uint8_t* key, size_t key_len,
                                  const uint8_t* nonce, size_t nonce_len,
                                  Backend backend) {
    if (key_len != KEY_SIZE) {
        throw InvalidLengthError(YSC1_ERROR_INVALID_KEY, KEY_SIZE, key_len,
                                 "YSC1 key must be " + std::to_string(KEY_SIZE) + " bytes");
    }
    if (nonce_len != NONCE_SIZE) {
        throw InvalidLengthError(YSC1_ERROR_INVALID_NONCE, NONCE_SIZE, nonce_len,
                                 "YSC1 nonce must be " + std::to_string(NONCE_SIZE) + " bytes");
    }

    ysc1_error_t err = ysc1_init_with_backend(&ctx_, VARIANT, key, key_len, nonce, nonce_len,
                                              static_cast<ysc1_backend_t>(backend));
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 initialization failed");
    }
}

template<size_t KEY_BITS>
StreamCipher<KEY_BITS>::StreamCipher(const Key& key, const Nonce& nonce, Backend backend) {
    init(key.data(), key.size(), nonce.data(), nonce.size(), backend);
}

template<size_t KEY_BITS>
StreamCipher<KEY_BITS>::StreamCipher(const ByteVec& key, const ByteVec& nonce, Backend backend) {
    init(key.data(), key.size(), nonce.data(), nonce.size(), backend);
}

template<size_t KEY_BITS>
StreamCipher<KEY_BITS>::~StreamCipher() {
    ysc1_clear(&ctx_);
}

template<size_t KEY_BITS>
StreamCipher<KEY_BITS>::StreamCipher(StreamCipher&& o) noexcept : ctx_(o.ctx_) {
    ysc1_clear(&o.ctx_);
}

template<size_t KEY_BITS>
StreamCipher<KEY_BITS>& StreamCipher<KEY_BITS>::operator=(StreamCipher&& o) noexcept {
    if (this != &o) {
        ysc1_clear(&ctx_);
        ctx_ = o.ctx_;
        ysc1_clear(&o.ctx_);
    }
    return *this;
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::apply_keystream(uint8_t* data, size_t len) {
    ysc1_error_t err = ysc1_crypt(&ctx_, data, len, data);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 keystream failed");
    }
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::apply_keystream(ByteVec& data) {
    apply_keystream(data.data(), data.size());
}

template<size_t KEY_BITS>
ByteVec StreamCipher<KEY_BITS>::process(const ByteVec& input) {
    ByteVec output(input.size());
    ysc1_error_t err = ysc1_crypt(&ctx_, input.data(), input.size(), output.data());
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 keystream failed");
    }
    return output;
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::keystream_block(uint8_t out[YSC1_BLOCK_SIZE]) {
    ysc1_error_t err = ysc1_keystream_block(&ctx_, out);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 keystream failed");
    }
}

template<size_t KEY_BITS>
uint64_t StreamCipher<KEY_BITS>::current_position() const {
    uint64_t pos = 0;
    ysc1_error_t err = ysc1_get_block_pos(&ctx_, &pos);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 position query failed");
    }
    return pos;
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::seek(uint64_t block) {
    ysc1_error_t err = ysc1_set_block_pos(&ctx_, block);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 seek failed");
    }
}

template<size_t KEY_BITS>
uint64_t StreamCipher<KEY_BITS>::current_byte_position() const {
    uint64_t pos = 0;
    ysc1_error_t err = ysc1_get_byte_pos(&ctx_, &pos);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 byte position is not representable");
    }
    return pos;
}

template<size_t KEY_BITS>
void StreamCipher<KEY_BITS>::seek_bytes(uint64_t offset) {
    ysc1_error_t err = ysc1_seek_bytes(&ctx_, offset);
    if (err != YSC1_SUCCESS) {
        throw_error(err, "YSC1 seek failed");
    }
}

template<size_t KEY_BITS>
Backend StreamCipher<KEY_BITS>::backend() const {
    return static_cast<Backend>(ysc1_get_backend(&ctx_));
}

template<size_t KEY_BITS>
typename StreamCipher<KEY_BITS>::Key StreamCipher<KEY_BITS>::generateKey() {
    Key key;
    if (ysc1_random_bytes(key.data(), key.size()) != YSC1_SUCCESS) {
        throw Error(YSC1_ERROR_RANDOM_FAILED, "RNG failed");
    }
    return key;
}

template<size_t KEY_BITS>
typename StreamCipher<KEY_BITS>::Nonce StreamCipher<KEY_BITS>::generateNonce() {
    Nonce nonce;
    if (ysc1_random_bytes(nonce.data(), nonce.size()) != YSC1_SUCCESS) {
        throw Error(YSC1_ERROR_RANDOM_FAILED, "RNG failed");
    }
    return nonce;
}

template class StreamCipher<512>;
template class StreamCipher<1024>;

} // namespace ysc1
