#include "session/session_store.hpp"

#include <ctype.h>
#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/uuid.hpp"

namespace {
static const constexpr size_t kMaxIdLength = 128;
static const constexpr char* kForkPrefix = ".fork-";

bool IsIllegalChar(char c) {
  return !isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' &&
         c != '_';
}
}  // namespace

namespace session {

void SessionStore::ValidateId(const std::string& id) {
  if (id.empty() || id.size() > kMaxIdLength) {
    throw invalid_input("Invalid session id length");
  }
  if (id[0] == '.' ||
      std::find_if(id.begin(), id.end(), IsIllegalChar) != id.end()) {
    throw invalid_input("Invalid session id: " + id);
  }
}

std::string SessionStore::Root(const std::string& session_id) const {
  ValidateId(session_id);
  return util::File::JoinPath(base_directory_, session_id);
}

bool SessionStore::Exists(const std::string& session_id) const {
  return util::File::IsDirectory(Root(session_id));
}

std::string SessionStore::GetOrCreate(const std::string& session_id) const {
  std::string root = Root(session_id);
  util::File::MakeDirs(base_directory_);
  if (mkdir(root.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) == -1) {
    if (errno != EEXIST) {
      throw std::system_error(errno, std::system_category(), "mkdir " + root);
    }
    if (!util::File::IsDirectory(root)) {
      throw std::system_error(ENOTDIR, std::system_category(), root);
    }
  } else {
    util::Chown(root, owner_);
    LOG(INFO) << "Created session " << session_id;
  }
  return root;
}

std::string SessionStore::Fork(const std::string& session_id) const {
  std::string source = Root(session_id);
  struct stat st {};
  if (stat(source.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)) {
    throw session_not_found(session_id);
  }
  std::string new_id = util::NewUUID();
  std::string destination = Root(new_id);

  // The staging directory is removed on the way out unless it was published.
  util::TempDir staging(base_directory_, kForkPrefix);
  util::File::CopyTree(source, staging.Path());
  if (geteuid() == 0 && st.st_uid != 0) {
    util::User source_owner;
    source_owner.uid = st.st_uid;
    source_owner.gid = st.st_gid;
    util::ChownTree(staging.Path(), source_owner);
  }
  if (chmod(staging.Path().c_str(), st.st_mode & 07777) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "chmod " + staging.Path());
  }
  util::File::Move(staging.Path(), destination);
  staging.Keep();
  LOG(INFO) << "Forked session " << session_id << " into " << new_id;
  return new_id;
}

}  // namespace session
