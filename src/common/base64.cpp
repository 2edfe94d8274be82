#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <stdexcept>

namespace bayview {
using namespace std;
namespace it = boost::archive::iterators;

static bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

string encode_base64(const string &binary) {
    using iterator = it::base64_from_binary<it::transform_width<string::const_iterator, 6, 8>>;
    string encoded(iterator(binary.begin()), iterator(binary.end()));
    encoded.append((3 - binary.size() % 3) % 3, '=');
    return encoded;
}

string decode_base64(const string &encoded) {
    using iterator = it::transform_width<it::binary_from_base64<string::const_iterator>, 8, 6>;

    string text;
    text.reserve(encoded.size());
    for (char c : encoded)
        if (c != '\r' && c != '\n') text.push_back(c);

    if (text.size() % 4 != 0)
        throw invalid_argument("illegal base64 data: length " + to_string(text.size()) + " is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=')
        ++padding;

    for (size_t i = 0; i < text.size() - padding; ++i)
        if (!is_base64_char(text[i]))
            throw invalid_argument("illegal base64 data at input byte " + to_string(i));

    // 填充字符替换为值为 0 的 'A'，解码后再去掉多余的字节
    text.replace(text.size() - padding, padding, padding, 'A');
    string binary(iterator(text.begin()), iterator(text.end()));
    binary.resize(binary.size() - padding);
    return binary;
}

}  // namespace bayview
