#pragma once

#include <optional>
#include <string>

#include "exec/exec_types.hpp"

namespace codebox::content {

// Turns a file's transport encoding into canonical bytes. No encoding
// means utf8, which passes bytes through untouched. Throws
// exec::ExecError (kInternal) when base64/hex text is not UTF-8 or
// does not decode.
exec::Bytes Decode(const exec::Bytes& content, std::optional<exec::Encoding> encoding);

inline exec::Bytes Decode(const exec::File& file) {
    return Decode(file.content, file.encoding);
}

std::string EncodeBase64(const exec::Bytes& data);
std::string EncodeHex(const exec::Bytes& data);

}  // namespace codebox::content
