#include "utils/hash.hpp"

namespace jsonbcpp::utils {

    uint32_t djb2_hash(std::string_view key) {
        uint32_t hash = 5381;
        for (char c : key) {
            hash = ((hash << 5) + hash) + static_cast<unsigned char>(c); /* hash * 33 + c */
        }
        return hash;
    }

} // namespace jsonbcpp::utils
