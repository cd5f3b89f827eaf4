#include "sqlfrag/version.h"

namespace sqlfrag {

namespace {

#ifndef SQLFRAG_VERSION
#define SQLFRAG_VERSION "0.0.0"
#endif

#ifndef SQLFRAG_GIT_COMMIT
#define SQLFRAG_GIT_COMMIT "unknown"
#endif

#ifndef SQLFRAG_GIT_DIRTY
#define SQLFRAG_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = SQLFRAG_VERSION;
  info.git_commit = SQLFRAG_GIT_COMMIT;
  info.git_dirty = (SQLFRAG_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = "sqlfrag " + info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace sqlfrag
