#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pivot::internal {

    // FNV-1a 64; fields are tagged and length-prefixed so adjacent fields cannot alias
    class content_hasher {
      public:
        static constexpr uint64_t offset_basis = 0xcbf29ce484222325ULL;
        static constexpr uint64_t prime = 0x100000001b3ULL;

        constexpr void update_bytes(std::string_view bytes) {
            for (auto c : bytes) {
                state_ ^= static_cast<uint8_t>(c);
                state_ *= prime;
            }
        }

        constexpr void update_u64(uint64_t value) {
            for (int i = 0; i < 8; ++i) {
                state_ ^= static_cast<uint8_t>(value >> (i * 8));
                state_ *= prime;
            }
        }

        constexpr void update_field(std::string_view tag, std::string_view value) {
            update_u64(tag.size());
            update_bytes(tag);
            update_u64(value.size());
            update_bytes(value);
        }

        constexpr uint64_t value() const { return state_; }

        std::string hex() const {
            static constexpr char digits[] = "0123456789abcdef";
            std::string out(16U, '0');
            auto v = state_;
            for (int i = 15; i >= 0; --i) {
                out[static_cast<size_t>(i)] = digits[v & 0xfU];
                v >>= 4U;
            }
            return out;
        }

      private:
        uint64_t state_{offset_basis};
    };

}  // namespace pivot::internal
