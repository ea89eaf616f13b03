#pragma once

#include "common/namespace.hpp"

#include <boost/optional.hpp>

#include <cstddef>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

BEGIN_NAMESPACE(bamkit)

// One typed optional field value as stored in a BAM auxiliary block: the
// type byte followed by the encoded value.
class AuxValue {
public:
    // type is one of AcCsSiIfdZHB. For Z and H, payload excludes the
    // terminating NUL. Throws std::invalid_argument if payload is not a
    // value of that type.
    AuxValue(char type, std::vector<uint8_t> const& payload);

    static AuxValue from_int(int32_t value);
    static AuxValue from_char(char value);
    static AuxValue from_float(float value);
    static AuxValue from_string(std::string const& value);

    char type() const;
    bool is_integer() const;
    bool is_string() const;

    // Each conversion is none when the value is of another type.
    boost::optional<int64_t> as_int() const;
    boost::optional<char> as_char() const;
    boost::optional<double> as_float() const;
    boost::optional<std::string> as_string() const;

    // Type byte followed by the encoded value, as found in a bam1_t.
    std::vector<uint8_t> const& encoded() const;

    bool operator==(AuxValue const& rhs) const;
    bool operator!=(AuxValue const& rhs) const;

private:
    std::vector<uint8_t> data_;
};

// The optional fields of one alignment in the order they were stored.
class AuxFields {
public:
    typedef std::pair<std::string, AuxValue> value_type;
    typedef std::vector<value_type>::const_iterator const_iterator;

    // Splits a raw BAM auxiliary block into its fields. Throws
    // std::runtime_error if the block is truncated or holds an unknown type.
    static AuxFields parse(uint8_t const* begin, uint8_t const* end);

    // key must be two characters.
    void push_back(std::string const& key, AuxValue const& value);

    // First field named key, or null.
    AuxValue const* find(std::string const& key) const;

    std::size_t size() const;
    bool empty() const;
    const_iterator begin() const;
    const_iterator end() const;

    // Size in bytes of the encoded block.
    std::size_t encoded_size() const;
    // Writes the encoded block to dst, which must hold encoded_size() bytes.
    void encode(uint8_t* dst) const;

    bool operator==(AuxFields const& rhs) const;
    bool operator!=(AuxFields const& rhs) const;

private:
    std::vector<value_type> fields_;
};

inline
char AuxValue::type() const {
    return char(data_[0]);
}

inline
std::vector<uint8_t> const& AuxValue::encoded() const {
    return data_;
}

inline
std::size_t AuxFields::size() const {
    return fields_.size();
}

inline
bool AuxFields::empty() const {
    return fields_.empty();
}

inline
AuxFields::const_iterator AuxFields::begin() const {
    return fields_.begin();
}

inline
AuxFields::const_iterator AuxFields::end() const {
    return fields_.end();
}

END_NAMESPACE(bamkit)
