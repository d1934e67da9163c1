/**
 * @file stream_cipher.h
 * @brief YSC1 keyed keystream generator
 *
 * YSC1 runs a 1024-bit ARX Lai-Massey permutation in counter mode:
 * - 16 x 64-bit word state, built from key + nonce by a fixed number of
 *   initialization rounds
 * - block counter in state word 12, incremented before every block
 * - each 512-bit block is words 0..7 of the permuted state copy
 *
 * Two variants are supported:
 * - YSC1-512:  64-byte key, 64-byte nonce, 16 init rounds, 8 keystream rounds
 * - YSC1-1024: 128-byte key, 64-byte nonce, 20 init rounds, 10 keystream rounds
 *
 * Scalar, SSE2 and AVX2 backends produce identical output. The backend is
 * chosen once per context.
 *
 * Keystream only: no authentication is provided.
 *
 * The counter only diffuses into output words 4 and 6: words 0-3, 5 and 7
 * are the same in every block of one context.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef YSC1_CRYPTO_STREAM_CIPHER_H
#define YSC1_CRYPTO_STREAM_CIPHER_H

#include "ysc1/core/common.h"
#include "ysc1/core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

typedef enum {
    YSC1_VARIANT_512 = 512,
    YSC1_VARIANT_1024 = 1024
} ysc1_variant_t;

typedef enum {
    YSC1_BACKEND_AUTO = 0,   // Best available backend
    YSC1_BACKEND_SOFT = 1,   // Portable scalar
    YSC1_BACKEND_SSE2 = 2,   // 2 x 64-bit lanes
    YSC1_BACKEND_AVX2 = 3    // 4 x 64-bit lanes
} ysc1_backend_t;

/**
 * @brief YSC1 context
 */
typedef struct {
    uint64_t state[16];        // Permutation state, word 12 is the block counter
    uint8_t keystream[64];     // Current keystream block
    size_t remaining;          // Unused bytes at the end of keystream
    uint32_t keystream_rounds; // Rounds per block
    int variant;               // ysc1_variant_t
    int backend;               // Resolved ysc1_backend_t, never AUTO
    int initialized;
    int exhausted;             // Set once the block counter ran out
} ysc1_ctx_t;

/* ============================================================================
 * Context API
 * ============================================================================ */

/**
 * @brief Initialize a YSC1 context with the best available backend
 *
 * @param ctx Context to initialize
 * @param variant YSC1_VARIANT_512 or YSC1_VARIANT_1024
 * @param key Key bytes (64 or 128 depending on variant)
 * @param key_len Key length in bytes
 * @param nonce Nonce bytes (64)
 * @param nonce_len Nonce length in bytes
 * @return YSC1_SUCCESS, YSC1_ERROR_INVALID_PARAM, YSC1_ERROR_INVALID_KEY
 *         or YSC1_ERROR_INVALID_NONCE
 */
YSC1_API ysc1_error_t ysc1_init(
    ysc1_ctx_t* ctx,
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len
);

/**
 * @brief Initialize a YSC1 context with an explicit backend
 *
 * @return As ysc1_init, or YSC1_ERROR_NOT_SUPPORTED if @p backend is not
 *         available on this build or CPU
 */
YSC1_API ysc1_error_t ysc1_init_with_backend(
    ysc1_ctx_t* ctx,
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len,
    ysc1_backend_t backend
);

/**
 * @brief XOR keystream into data (encryption and decryption are the same)
 *
 * @p input and @p output may be the same buffer. If the block counter cannot
 * cover @p input_len bytes, nothing is written, the context is marked
 * exhausted and YSC1_ERROR_COUNTER_EXHAUSTED is returned.
 *
 * @param ctx Initialized context
 * @param input Input data (may be NULL if input_len is 0)
 * @param input_len Input length
 * @param output Output buffer (same size as input)
 * @return YSC1_SUCCESS or error code
 */
YSC1_API ysc1_error_t ysc1_crypt(
    ysc1_ctx_t* ctx,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

/**
 * @brief Generate the next raw keystream block
 *
 * Buffered keystream from a previous partial ysc1_crypt is discarded.
 */
YSC1_API ysc1_error_t ysc1_keystream_block(ysc1_ctx_t* ctx, uint8_t out[64]);

/**
 * @brief Current block counter (number of blocks generated so far)
 */
YSC1_API ysc1_error_t ysc1_get_block_pos(const ysc1_ctx_t* ctx, uint64_t* pos);

/**
 * @brief Set the block counter; the next block generated is block @p pos + 1
 */
YSC1_API ysc1_error_t ysc1_set_block_pos(ysc1_ctx_t* ctx, uint64_t pos);

/**
 * @brief Current position in bytes of keystream consumed
 * @return YSC1_ERROR_INVALID_PARAM if the position does not fit in 64 bits
 */
YSC1_API ysc1_error_t ysc1_get_byte_pos(const ysc1_ctx_t* ctx, uint64_t* pos);

/**
 * @brief Seek to a byte offset in the keystream
 */
YSC1_API ysc1_error_t ysc1_seek_bytes(ysc1_ctx_t* ctx, uint64_t pos);

/**
 * @brief Backend a context is running on
 */
YSC1_API ysc1_backend_t ysc1_get_backend(const ysc1_ctx_t* ctx);

/**
 * @brief Short name of a backend ("auto", "soft", "sse2", "avx2")
 */
YSC1_API const char* ysc1_backend_name(ysc1_backend_t backend);

/**
 * @brief Whether a backend is compiled in and supported by this CPU
 * @return 1 if available, 0 otherwise
 */
YSC1_API int ysc1_backend_available(ysc1_backend_t backend);

/**
 * @brief Scrub a YSC1 context
 */
YSC1_API void ysc1_clear(ysc1_ctx_t* ctx);

/**
 * @brief Stateless YSC1 encryption/decryption from block position 0
 */
YSC1_API ysc1_error_t ysc1_xor(
    ysc1_variant_t variant,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    size_t nonce_len,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

#ifdef __cplusplus
} // extern "C"

#include <stdexcept>
#include <string>

namespace ysc1 {

/**
 * @brief Keystream backend
 */
enum class Backend : int {
    Auto = YSC1_BACKEND_AUTO,
    Soft = YSC1_BACKEND_SOFT,
    Sse2 = YSC1_BACKEND_SSE2,
    Avx2 = YSC1_BACKEND_AVX2
};

/**
 * @brief Library error carrying a ysc1_error_t code
 */
class YSC1_API Error : public std::runtime_error {
public:
    Error(ysc1_error_t code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ysc1_error_t code() const noexcept { return code_; }

private:
    ysc1_error_t code_;
};

/**
 * @brief Key or nonce length does not match the variant
 */
class YSC1_API InvalidLengthError : public std::invalid_argument {
public:
    InvalidLengthError(ysc1_error_t code, size_t expected, size_t actual, const std::string& what)
        : std::invalid_argument(what), code_(code), expected_(expected), actual_(actual) {}

    ysc1_error_t code() const noexcept { return code_; }
    size_t expected() const noexcept { return expected_; }
    size_t actual() const noexcept { return actual_; }

private:
    ysc1_error_t code_;
    size_t expected_;
    size_t actual_;
};

/**
 * @brief The block counter ran out; the cipher instance is no longer usable
 */
class YSC1_API CounterExhaustedError : public std::runtime_error {
public:
    CounterExhaustedError() : std::runtime_error("YSC1 block counter exhausted") {}
};

/**
 * @brief YSC1 stream cipher
 *
 * @tparam KEY_BITS 512 or 1024
 *
 * Usage:
 * @code
 *   auto key = ysc1::Ysc1_512::generateKey();
 *   auto nonce = ysc1::Ysc1_512::generateNonce();
 *   ysc1::Ysc1_512 cipher(key, nonce);
 *   ByteVec ct = cipher.process(plaintext);
 * @endcode
 */
template<size_t KEY_BITS>
class YSC1_API StreamCipher {
    static_assert(KEY_BITS == 512 || KEY_BITS == 1024,
                  "YSC1 supports 512-bit and 1024-bit keys only");

public:
    static constexpr size_t KEY_SIZE = KEY_BITS / 8;
    static constexpr size_t NONCE_SIZE = 64;
    static constexpr size_t BLOCK_SIZE = YSC1_BLOCK_SIZE;
    static constexpr ysc1_variant_t VARIANT =
        KEY_BITS == 512 ? YSC1_VARIANT_512 : YSC1_VARIANT_1024;

    using Key = ByteArray<KEY_SIZE>;
    using Nonce = ByteArray<NONCE_SIZE>;

    StreamCipher(const Key& key, const Nonce& nonce, Backend backend = Backend::Auto);

    /**
     * @throws InvalidLengthError if key or nonce has the wrong length
     */
    StreamCipher(const ByteVec& key, const ByteVec& nonce, Backend backend = Backend::Auto);

    ~StreamCipher();

    StreamCipher(const StreamCipher&) = delete;
    StreamCipher& operator=(const StreamCipher&) = delete;
    StreamCipher(StreamCipher&&) noexcept;
    StreamCipher& operator=(StreamCipher&&) noexcept;

    /**
     * @brief XOR keystream into @p data in place
     * @throws CounterExhaustedError
     */
    void apply_keystream(uint8_t* data, size_t len);
    void apply_keystream(ByteVec& data);

    /**
     * @brief Return @p input XORed with the next input.size() keystream bytes
     */
    ByteVec process(const ByteVec& input);

    /**
     * @brief Next raw 64-byte keystream block
     */
    void keystream_block(uint8_t out[YSC1_BLOCK_SIZE]);

    uint64_t current_position() const;
    void seek(uint64_t block);

    uint64_t current_byte_position() const;
    void seek_bytes(uint64_t offset);

    Backend backend() const;

    static Key generateKey();
    static Nonce generateNonce();

private:
    void init(const uint8_t* key, size_t key_len, const uint8_t* nonce, size_t nonce_len,
              Backend backend);

    ysc1_ctx_t ctx_;
};

using Ysc1_512 = StreamCipher<512>;
using Ysc1_1024 = StreamCipher<1024>;

extern template class StreamCipher<512>;
extern template class StreamCipher<1024>;

/**
 * @brief Throw the exception matching a failed C API status
 */
[[noreturn]] YSC1_API void throw_error(ysc1_error_t code, const char* context);

} // namespace ysc1

#endif // __cplusplus

#endif // YSC1_CRYPTO_STREAM_CIPHER_H
