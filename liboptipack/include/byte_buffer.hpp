#ifndef OPTIPACK_BYTE_BUFFER_HPP
#define OPTIPACK_BYTE_BUFFER_HPP

#include <span>
#include <string_view>
#include <vector>

namespace optipack {

    ///< Owned binary payload (images, archives).
    using ByteBuffer = std::vector<unsigned char>;
    ///< Non-owning view over a binary payload.
    using ByteView = std::span<const unsigned char>;

    inline ByteBuffer to_buffer(const std::string_view s) {
        return {s.begin(), s.end()};
    }

} // namespace optipack

#endif // OPTIPACK_BYTE_BUFFER_HPP
