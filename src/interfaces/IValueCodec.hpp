#ifndef IVALUECODEC_HPP
#define IVALUECODEC_HPP

#include <optional>
#include <string>

// Converts structured values to and from the opaque strings the cache stores.
// encode() returning nullopt means the value cannot be stored.
template <typename T>
class IValueCodec {
public:
    virtual ~IValueCodec() = default;
    virtual std::optional<std::string> encode(const T& value) const = 0;
    virtual std::optional<T> decode(const std::string& raw) const = 0;
};

#endif // IVALUECODEC_HPP
