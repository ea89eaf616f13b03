#include "AuxFields.hpp"

#include <boost/format.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

extern "C" {
    #include <bam.h>
}

using boost::format;

BEGIN_NAMESPACE(bamkit)

namespace {
    // Size of a fixed width value of the given type, or 0 if the type is
    // variable width or unknown.
    std::size_t fixed_size(char type) {
        switch (type) {
            case 'A': case 'c': case 'C': return 1;
            case 's': case 'S': return 2;
            case 'i': case 'I': case 'f': return 4;
            case 'd': return 8;
            default: return 0;
        }
    }

    template<typename T>
    std::vector<uint8_t> encode_value(T const& value) {
        std::vector<uint8_t> rv(sizeof(T));
        std::memcpy(rv.data(), &value, sizeof(T));
        return rv;
    }

    void check_available(uint8_t const* p, uint8_t const* end, std::size_t n) {
        if (std::size_t(end - p) < n)
            throw std::runtime_error("Truncated optional field data");
    }

    void check_payload(char type, std::vector<uint8_t> const& payload) {
        bool ok = false;
        if (std::size_t n = fixed_size(type)) {
            ok = payload.size() == n;
        }
        else if (type == 'Z' || type == 'H') {
            ok = std::find(payload.begin(), payload.end(), 0) == payload.end();
        }
        else if (type == 'B' && payload.size() >= 5) {
            char subtype = char(payload[0]);
            std::size_t elem_size = fixed_size(subtype);
            uint32_t count;
            std::memcpy(&count, &payload[1], sizeof(count));
            ok = elem_size > 0 && subtype != 'A' && subtype != 'd'
                && payload.size() - 5 == std::size_t(count) * elem_size;
        }

        if (!ok) {
            throw std::invalid_argument(str(format(
                "Invalid %1% byte value for optional field type '%2%'"
                ) % payload.size() % type));
        }
    }
}

AuxValue::AuxValue(char type, std::vector<uint8_t> const& payload) {
    check_payload(type, payload);
    data_.reserve(payload.size() + 2);
    data_.push_back(uint8_t(type));
    data_.insert(data_.end(), payload.begin(), payload.end());
    if (type == 'Z' || type == 'H')
        data_.push_back(0);
}

AuxValue AuxValue::from_int(int32_t value) {
    if (value < 0) {
        if (value >= -128)
            return AuxValue('c', encode_value(int8_t(value)));
        if (value >= -32768)
            return AuxValue('s', encode_value(int16_t(value)));
        return AuxValue('i', encode_value(value));
    }

    if (value <= 255)
        return AuxValue('C', encode_value(uint8_t(value)));
    if (value <= 65535)
        return AuxValue('S', encode_value(uint16_t(value)));
    return AuxValue('I', encode_value(uint32_t(value)));
}

AuxValue AuxValue::from_char(char value) {
    return AuxValue('A', std::vector<uint8_t>(1, uint8_t(value)));
}

AuxValue AuxValue::from_float(float value) {
    return AuxValue('f', encode_value(value));
}

AuxValue AuxValue::from_string(std::string const& value) {
    return AuxValue('Z', std::vector<uint8_t>(value.begin(), value.end()));
}

bool AuxValue::is_integer() const {
    switch (type()) {
        case 'c': case 'C': case 's': case 'S': case 'i': case 'I':
            return true;
        default:
            return false;
    }
}

bool AuxValue::is_string() const {
    return type() == 'Z' || type() == 'H';
}

boost::optional<int64_t> AuxValue::as_int() const {
    if (!is_integer())
        return boost::none;

    // bam_aux2i returns int32_t, which cannot hold all of 'I'
    if (type() == 'I') {
        uint32_t value;
        std::memcpy(&value, &data_[1], sizeof(value));
        return int64_t(value);
    }
    return int64_t(bam_aux2i(data_.data()));
}

boost::optional<char> AuxValue::as_char() const {
    if (type() != 'A')
        return boost::none;
    return bam_aux2A(data_.data());
}

boost::optional<double> AuxValue::as_float() const {
    if (type() == 'f')
        return double(bam_aux2f(data_.data()));
    if (type() == 'd')
        return bam_aux2d(data_.data());
    return boost::none;
}

boost::optional<std::string> AuxValue::as_string() const {
    char const* s = bam_aux2Z(data_.data());
    if (!s)
        return boost::none;
    return std::string(s);
}

bool AuxValue::operator==(AuxValue const& rhs) const {
    return data_ == rhs.data_;
}

bool AuxValue::operator!=(AuxValue const& rhs) const {
    return !(*this == rhs);
}

AuxFields AuxFields::parse(uint8_t const* begin, uint8_t const* end) {
    AuxFields rv;
    uint8_t const* p = begin;
    while (p < end) {
        check_available(p, end, 3);
        std::string key(reinterpret_cast<char const*>(p), 2);
        char type = char(p[2]);
        p += 3;

        uint8_t const* value_begin = p;
        if (std::size_t n = fixed_size(type)) {
            check_available(p, end, n);
            p += n;
            rv.push_back(key, AuxValue(type, std::vector<uint8_t>(value_begin, p)));
        }
        else if (type == 'Z' || type == 'H') {
            uint8_t const* nul = static_cast<uint8_t const*>(std::memchr(p, 0, end - p));
            if (!nul)
                throw std::runtime_error("Unterminated string in optional field data");
            p = nul + 1;
            rv.push_back(key, AuxValue(type, std::vector<uint8_t>(value_begin, nul)));
        }
        else if (type == 'B') {
            check_available(p, end, 5);
            char subtype = char(p[0]);
            std::size_t elem_size = fixed_size(subtype);
            if (elem_size == 0 || subtype == 'A' || subtype == 'd') {
                throw std::runtime_error(str(format(
                    "Unknown array type '%1%' in optional field %2%"
                    ) % subtype % key));
            }
            uint32_t count;
            std::memcpy(&count, p + 1, sizeof(count));
            p += 5;
            check_available(p, end, std::size_t(count) * elem_size);
            p += std::size_t(count) * elem_size;
            rv.push_back(key, AuxValue(type, std::vector<uint8_t>(value_begin, p)));
        }
        else {
            throw std::runtime_error(str(format(
                "Unknown type '%1%' in optional field %2%"
                ) % type % key));
        }
    }
    return rv;
}

void AuxFields::push_back(std::string const& key, AuxValue const& value) {
    if (key.size() != 2) {
        throw std::invalid_argument(str(format(
            "Optional field key '%1%' is not two characters"
            ) % key));
    }
    fields_.push_back(value_type(key, value));
}

AuxValue const* AuxFields::find(std::string const& key) const {
    for (const_iterator i = fields_.begin(); i != fields_.end(); ++i) {
        if (i->first == key)
            return &i->second;
    }
    return 0;
}

std::size_t AuxFields::encoded_size() const {
    std::size_t rv = 0;
    for (const_iterator i = fields_.begin(); i != fields_.end(); ++i)
        rv += 2 + i->second.encoded().size();
    return rv;
}

void AuxFields::encode(uint8_t* dst) const {
    for (const_iterator i = fields_.begin(); i != fields_.end(); ++i) {
        std::memcpy(dst, i->first.data(), 2);
        dst += 2;
        std::vector<uint8_t> const& data = i->second.encoded();
        std::memcpy(dst, data.data(), data.size());
        dst += data.size();
    }
}

bool AuxFields::operator==(AuxFields const& rhs) const {
    return fields_ == rhs.fields_;
}

bool AuxFields::operator!=(AuxFields const& rhs) const {
    return !(*this == rhs);
}

END_NAMESPACE(bamkit)
