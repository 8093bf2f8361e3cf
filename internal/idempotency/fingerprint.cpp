#include "fingerprint.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace casetrack::idempotency {

namespace {

// Scalars go through protobuf's JSON printer so escaping and number
// formatting match the parser that read them.
void AppendScalar(const google::protobuf::Value& value, std::string& out) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("fingerprint: failed to print JSON scalar: " + std::string(status.message()));
  }
  out += json;
}

void AppendCanonical(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStructValue: {
      const auto&                     fields = value.struct_value().fields();
      std::vector<const std::string*> keys;
      keys.reserve(fields.size());
      for (const auto& [key, _] : fields) keys.push_back(&key);
      std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

      out += '{';
      bool first = true;
      for (const auto* key : keys) {
        if (!first) out += ',';
        first = false;

        google::protobuf::Value key_value;
        key_value.set_string_value(*key);
        AppendScalar(key_value, out);
        out += ':';
        AppendCanonical(fields.at(*key), out);
      }
      out += '}';
      break;
    }

    case google::protobuf::Value::kListValue: {
      out += '[';
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out += ',';
        first = false;
        AppendCanonical(item, out);
      }
      out += ']';
      break;
    }

    default:
      AppendScalar(value, out);
      break;
  }
}

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

void DigestPart(EVP_MD_CTX* ctx, std::string_view part) {
  // length-prefix each part so ("ab","c") and ("a","bc") differ
  const std::string prefix = std::to_string(part.size()) + ":";
  if (EVP_DigestUpdate(ctx, prefix.data(), prefix.size()) != 1 || EVP_DigestUpdate(ctx, part.data(), part.size()) != 1) {
    throw std::runtime_error("fingerprint: EVP_DigestUpdate failed");
  }
}

} // namespace

std::string NormalizeBody(std::string_view body) {
  if (body.empty()) {
    return {};
  }

  google::protobuf::Value                  parsed;
  google::protobuf::util::JsonParseOptions options;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(body), &parsed, options);
  if (!status.ok()) {
    return std::string(body);
  }

  std::string out;
  AppendCanonical(parsed, out);
  return out;
}

std::string ComputeFingerprint(std::string_view operation, std::string_view resource_path, std::string_view body) {
  std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("fingerprint: EVP_DigestInit_ex failed");
  }

  DigestPart(ctx.get(), operation);
  DigestPart(ctx.get(), resource_path);
  DigestPart(ctx.get(), NormalizeBody(body));

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("fingerprint: EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

} // namespace casetrack::idempotency
