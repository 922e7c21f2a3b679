#include "newsdesk/index/index_state.hpp"

namespace newsdesk::index {

common::Status IndexState::verify_consistency() const {
  if (documents.size() != vectors.size()) {
    return common::Status::error(common::ErrorCode::Corrupt,
                                 std::to_string(documents.size()) + " documents but " +
                                     std::to_string(vectors.size()) + " vectors");
  }
  for (const auto *doc : documents.documents()) {
    if (!vectors.contains(doc->id)) {
      return common::Status::error(common::ErrorCode::Corrupt, "no vector for " + doc->id);
    }
  }
  return common::Status::success();
}

} // namespace newsdesk::index
