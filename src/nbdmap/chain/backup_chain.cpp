#include "backup_chain.hpp"

#include <unordered_set>

#include <redlog.hpp>

#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::chain {

namespace {
auto log_chain = redlog::get_logger("nbdmap.chain");
} // namespace

result<backup_chain> backup_chain::from_paths(const std::vector<std::string>& paths) {
  std::vector<file_ref> refs;
  refs.reserve(paths.size());
  for (size_t i = 0; i < paths.size(); ++i) {
    file_ref ref{};
    ref.path = paths[i];
    ref.sequence = static_cast<uint32_t>(i);
    ref.kind = i == 0 ? file_kind::full : file_kind::incremental;
    refs.push_back(std::move(ref));
  }
  return from_refs(std::move(refs));
}

result<backup_chain> backup_chain::from_list(const std::string& list) {
  return from_paths(util::split_list(list, ','));
}

result<backup_chain> backup_chain::from_refs(std::vector<file_ref> refs) {
  if (refs.empty()) {
    return error_result<backup_chain>(error_code::chain_error, "backup chain is empty");
  }
  if (refs.front().kind != file_kind::full) {
    return error_result<backup_chain>(
        error_code::chain_error, "chain must start with a full backup, got incremental " + refs.front().path
    );
  }

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < refs.size(); ++i) {
    const auto& ref = refs[i];
    if (ref.path.empty()) {
      return error_result<backup_chain>(error_code::chain_error, "chain entry " + std::to_string(i) + " has no path");
    }
    if (i > 0 && ref.kind != file_kind::incremental) {
      return error_result<backup_chain>(
          error_code::chain_error, "only the first chain entry may be a full backup: " + ref.path
      );
    }
    if (i > 0 && ref.sequence <= refs[i - 1].sequence) {
      return error_result<backup_chain>(
          error_code::chain_error, "chain sequence is not strictly increasing at " + ref.path
      );
    }
    if (!seen.insert(ref.path).second) {
      return error_result<backup_chain>(error_code::chain_error, "file listed twice in chain: " + ref.path);
    }
  }

  log_chain.dbg(
      "built backup chain", redlog::field("files", refs.size()), redlog::field("full", refs.front().path)
  );
  return ok_result(backup_chain(std::move(refs)));
}

} // namespace nbdmap::chain
