#include "document_hash.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <array>
#include <stdexcept>

extern "C" {
#include <blake3.h>
}

namespace artifact::document {

using artifact::store::v1::Document;

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string ToHex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Map fields (Struct) are emitted in key order.
std::string DeterministicBytes(const Document& document) {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream raw(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!document.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("document encoding failed");
    }
  }
  return bytes;
}

} // namespace

std::string HexDigest(std::string_view bytes) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return ToHex(out.data(), out.size());
}

std::string ComputeHash(const Document& document) {
  Document unsealed = document;
  unsealed.clear_hash();
  return HexDigest(DeterministicBytes(unsealed));
}

void Seal(Document& document) {
  document.set_hash(ComputeHash(document));
}

bool VerifyHash(const Document& document) {
  return !document.hash().empty() && document.hash() == ComputeHash(document);
}

bool IsWellFormedHash(std::string_view hash) {
  if (hash.size() != BLAKE3_OUT_LEN * 2) return false;
  for (char c : hash) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

} // namespace artifact::document
