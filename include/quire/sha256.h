#ifndef QUIRE_SHA256_H
#define QUIRE_SHA256_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace quire::crypto {

    /**
     * @brief Incremental SHA-256 (FIPS 180-4) producing a lowercase hex digest.
     */
    class SHA256 {
    public:
        static constexpr size_t kDigestHexLength = 64;

        SHA256() { reset(); }

        void update(const void* data, size_t len) {
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            while (len > 0) {
                size_t take = 64 - m_buffered;
                if (take > len) take = len;
                std::memcpy(m_block + m_buffered, bytes, take);
                m_buffered += take;
                bytes += take;
                len -= take;
                if (m_buffered == 64) {
                    compress(m_block);
                    m_total_bits += 512;
                    m_buffered = 0;
                }
            }
        }

        /**
         * @brief Pads the message and returns the digest. The object is reset afterwards.
         */
        std::string final() {
            m_total_bits += static_cast<uint64_t>(m_buffered) * 8;

            m_block[m_buffered++] = 0x80;
            if (m_buffered > 56) {
                std::memset(m_block + m_buffered, 0, 64 - m_buffered);
                compress(m_block);
                m_buffered = 0;
            }
            std::memset(m_block + m_buffered, 0, 56 - m_buffered);
            for (int i = 0; i < 8; ++i) {
                m_block[63 - i] = static_cast<uint8_t>(m_total_bits >> (8 * i));
            }
            compress(m_block);

            static const char* hex = "0123456789abcdef";
            std::string digest;
            digest.reserve(kDigestHexLength);
            for (uint32_t word : m_state) {
                for (int shift = 28; shift >= 0; shift -= 4) {
                    digest.push_back(hex[(word >> shift) & 0xF]);
                }
            }
            reset();
            return digest;
        }

        static std::string hash(const void* data, size_t len) {
            SHA256 sha;
            sha.update(data, len);
            return sha.final();
        }

        static std::string hash(const std::vector<uint8_t>& bytes) {
            return hash(bytes.data(), bytes.size());
        }

        static std::string hash(const std::string& text) {
            return hash(text.data(), text.size());
        }

    private:
        uint32_t m_state[8];
        uint8_t m_block[64];
        size_t m_buffered;
        uint64_t m_total_bits;

        static constexpr uint32_t kRound[64] = {
            0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
            0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
            0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
            0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
            0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
            0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
            0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
            0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
        };

        void reset() {
            static constexpr uint32_t kInitial[8] = {
                0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
            };
            std::memcpy(m_state, kInitial, sizeof(m_state));
            std::memset(m_block, 0, sizeof(m_block));
            m_buffered = 0;
            m_total_bits = 0;
        }

        void compress(const uint8_t* block) {
            uint32_t w[64];
            for (int i = 0; i < 16; ++i) {
                w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
                       (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
                       (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
                       static_cast<uint32_t>(block[i * 4 + 3]);
            }
            for (int i = 16; i < 64; ++i) {
                w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
            }

            uint32_t a = m_state[0], b = m_state[1], c = m_state[2], d = m_state[3];
            uint32_t e = m_state[4], f = m_state[5], g = m_state[6], h = m_state[7];

            for (int i = 0; i < 64; ++i) {
                uint32_t t1 = h + big_sigma1(e) + ((e & f) ^ (~e & g)) + kRound[i] + w[i];
                uint32_t t2 = big_sigma0(a) + ((a & b) ^ (a & c) ^ (b & c));
                h = g; g = f; f = e; e = d + t1;
                d = c; c = b; b = a; a = t1 + t2;
            }

            m_state[0] += a; m_state[1] += b; m_state[2] += c; m_state[3] += d;
            m_state[4] += e; m_state[5] += f; m_state[6] += g; m_state[7] += h;
        }

        static uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
        static uint32_t small_sigma0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
        static uint32_t small_sigma1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
        static uint32_t big_sigma0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
        static uint32_t big_sigma1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
    };

}

#endif
