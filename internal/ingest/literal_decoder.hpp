#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace tripgraph::ingest {

/*
  Decoder for the Python-literal text the corpus uses for nested fields.

  Accepted: lists, tuples and sets (all become list values), dicts, quoted
  strings (r/u/b prefixes, triple quotes, escapes, adjacent-literal
  concatenation), ints (hex/octal/binary, underscores), floats, unary signs,
  True/False/None.

  Never throws. On failure ok is false, value is null and error says where
  decoding stopped. Repeated dict keys keep the last value.
*/

// Literal form of the outermost value; tuples and sets both arrive as list values.
enum class LiteralContainer { kScalar, kList, kTuple, kSet, kDict };

struct LiteralDecodeResult {
  google::protobuf::Value value;
  LiteralContainer        container = LiteralContainer::kScalar;
  bool                    ok        = false;
  std::string             error;
};

LiteralDecodeResult DecodeLiteral(std::string_view text);

} // namespace tripgraph::ingest
