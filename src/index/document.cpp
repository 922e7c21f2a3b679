#include "newsdesk/index/document.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/hash.hpp"

namespace newsdesk::index {

std::string content_hash_for(const std::string_view text) {
  return common::sha256_hex(common::trim(std::string(text)));
}

std::string document_id_for(const std::string &content_hash) {
  return "doc-" + content_hash.substr(0, 24);
}

std::string embedding_text(const Document &document) {
  std::string out = "[" + document.category + "]";
  if (document.title.has_value() && !document.title->empty()) {
    out += " " + *document.title;
  }
  out += "\n";
  out += document.text;
  return out;
}

} // namespace newsdesk::index
