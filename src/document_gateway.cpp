#include "document_gateway.hpp"

#include "text_utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Throws ImportError(IOFailure) when the generator is not seeded.
void fillRandom(unsigned char* buffer, std::size_t length) {
  if (RAND_bytes(buffer, static_cast<int>(length)) == 1) return;

  char reason[256];
  ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
  spdlog::error("DocumentGateway: RAND_bytes failed: {}", reason);
  throw ImportError(ErrorKind::IOFailure, std::string("No secure random data: ") + reason);
}

ImportError ioFailure(const std::string& what, int err) {
  return ImportError(ErrorKind::IOFailure, what + ": " + std::strerror(err));
}

// Closes the descriptor on scope exit.
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }

  // Reports the close() error that the destructor would drop.
  void close() {
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) throw ioFailure("close failed", errno);
  }

private:
  int fd_;
};

void writeAll(int fd, const char* data, std::size_t length, off_t offset) {
  while (length > 0) {
    ssize_t n = ::pwrite(fd, data, length, offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ioFailure("write failed", errno);
    }
    data += n;
    length -= static_cast<std::size_t>(n);
    offset += n;
  }
}

void copyInto(const fs::path& original, int target) {
  std::ifstream in(original, std::ios::binary);
  if (!in) throw ImportError(ErrorKind::IOFailure, "Failed to open original document");

  std::vector<char> buffer(64 * 1024);
  off_t offset = 0;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = in.gcount();
    if (n <= 0) break;
    writeAll(target, buffer.data(), static_cast<std::size_t>(n), offset);
    offset += n;
  }
  if (in.bad()) throw ImportError(ErrorKind::IOFailure, "Failed to read original document");
}

} // namespace

DocumentHandle::DocumentHandle(fs::path path, std::string displayName)
  : path_(std::move(path)),
    displayName_(displayName.empty() ? path_.filename().string() : std::move(displayName)) {}

std::string generateOpaqueName() {
  unsigned char bytes[16];
  fillRandom(bytes, sizeof(bytes));
  static const char hex[] = "0123456789abcdef";
  std::string name;
  name.reserve(sizeof(bytes) * 2);
  for (unsigned char b : bytes) {
    name += hex[b >> 4];
    name += hex[b & 0x0F];
  }
  return name;
}

void secureDeleteFile(const fs::path& file, std::size_t overwriteBytes) {
  std::error_code ec;
  if (!fs::exists(file, ec)) return;

  std::uintmax_t size = fs::file_size(file, ec);
  if (ec) throw ImportError(ErrorKind::IOFailure, "Failed to stat " + file.filename().string());

  std::size_t length = static_cast<std::size_t>(std::min<std::uintmax_t>(size, overwriteBytes));
  if (length > 0) {
    FileDescriptor fd(::open(file.c_str(), O_WRONLY | O_CLOEXEC));
    if (fd.get() < 0) throw ioFailure("Failed to open " + file.filename().string(), errno);

    std::vector<unsigned char> noise(length);
    fillRandom(noise.data(), noise.size());
    writeAll(fd.get(), reinterpret_cast<const char*>(noise.data()), noise.size(), 0);
    if (::fsync(fd.get()) != 0) throw ioFailure("fsync failed", errno);
    fd.close();
  }

  if (!fs::remove(file, ec) && ec) {
    throw ImportError(ErrorKind::IOFailure,
      "Failed to remove " + file.filename().string() + ": " + ec.message());
  }
}

StagedDocument::StagedDocument(const fs::path& original, const fs::path& stagingDirectory,
                               const StorageProtection& protection, std::size_t overwriteBytes)
  : path_(stagingDirectory / (generateOpaqueName() + ".pdf")), overwriteBytes_(overwriteBytes) {
  // O_EXCL: never take over an existing file, so a failure here leaves
  // nothing to clean up.
  FileDescriptor out(::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                            S_IRUSR | S_IWUSR));
  if (out.get() < 0) throw ioFailure("Failed to create staged copy", errno);

  try {
    copyInto(original, out.get());
    out.close();
    protection.protectFile(path_);
  } catch (const std::exception&) {
    try {
      secureDeleteFile(path_, overwriteBytes_);
    } catch (const ImportError& cleanup) {
      spdlog::error("DocumentGateway: cleanup of partial copy {} failed: {}",
                    path_.filename().string(), cleanup.what());
    }
    throw;
  }
  spdlog::debug("DocumentGateway: staged {}", path_.filename().string());
}

StagedDocument::~StagedDocument() {
  try {
    secureDeleteFile(path_, overwriteBytes_);
    spdlog::debug("DocumentGateway: destroyed {}", path_.filename().string());
  } catch (const std::exception& e) {
    spdlog::error("DocumentGateway: secure deletion of {} failed: {}",
                  path_.filename().string(), e.what());
  }
}

DocumentGateway::DocumentGateway(GatewayConfig config, ImportLimits limits,
                                 std::shared_ptr<StorageProtection> protection,
                                 std::shared_ptr<AccessScope> accessScope)
  : config_(std::move(config)),
    limits_(std::move(limits)),
    protection_(std::move(protection)),
    accessScope_(std::move(accessScope)) {}

void DocumentGateway::validate(const DocumentHandle& handle) const {
  const fs::path& path = handle.path();
  std::error_code ec;

  if (!fs::exists(path, ec)) {
    throw ImportError(ErrorKind::FileNotFound, "File not found");
  }
  if (!fs::is_regular_file(path, ec)) {
    throw ImportError(ErrorKind::InvalidFileType, "Invalid file type: not a regular file");
  }

  std::uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    throw ImportError(ErrorKind::IOFailure, "File error: " + ec.message());
  }
  if (size > limits_.maxFileSize) {
    throw ImportError(ErrorKind::FileTooLarge,
      "File too large (" + formatMegabytes(size) + "). Maximum allowed: " +
      formatMegabytes(limits_.maxFileSize));
  }

  std::string extension = path.extension().string();
  if (!extension.empty() && extension.front() == '.') extension.erase(0, 1);
  extension = toLowerUtf8(extension);
  if (extension != limits_.allowedExtension) {
    throw ImportError(ErrorKind::InvalidFileType,
      "Invalid file type: " + extension + ". Only PDF files are allowed");
  }
}

void DocumentGateway::secureDelete(const fs::path& file) const {
  secureDeleteFile(file, config_.overwriteBytes);
}

std::size_t DocumentGateway::purgeStagingArea() const {
  std::error_code ec;
  if (!fs::exists(config_.stagingDirectory, ec)) return 0;

  std::vector<fs::path> leftovers;
  for (fs::directory_iterator it(config_.stagingDirectory, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code typeError;
    if (it->is_regular_file(typeError)) leftovers.push_back(it->path());
  }
  if (ec) {
    spdlog::warn("DocumentGateway: cannot list staging area: {}", ec.message());
  }

  std::size_t removed = 0;
  for (const fs::path& file : leftovers) {
    try {
      secureDeleteFile(file, config_.overwriteBytes);
      removed++;
    } catch (const ImportError& e) {
      spdlog::warn("DocumentGateway: failed to purge {}: {}", file.filename().string(), e.what());
    }
  }
  if (removed > 0) spdlog::info("DocumentGateway: purged {} staged file(s)", removed);
  return removed;
}

fs::path DocumentGateway::prepareStagingDirectory() const {
  std::error_code ec;
  fs::create_directories(config_.stagingDirectory, ec);
  if (ec) {
    throw ImportError(ErrorKind::IOFailure, "Failed to create staging directory: " + ec.message());
  }
  protection_->protectDirectory(config_.stagingDirectory);
  return config_.stagingDirectory;
}
