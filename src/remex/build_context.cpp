#include "build_context.h"

#include <fnmatch.h>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <algorithm>

#include <openssl/evp.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <remex/errors.h>
#include "utils.h"

namespace {

const size_t kBlockSize = 512;
const uint64_t kMaxEntrySize = 077777777777ULL; // 11 octal digits
// fixed so that hashes depend on contents only; 2000-01-01
const uint64_t kEntryMtime = 946684800;

std::string Trim(const std::string& str) {
  size_t start = str.find_first_not_of(" \t\r");
  if (start == std::string::npos) return "";
  size_t end = str.find_last_not_of(" \t\r");
  return str.substr(start, end - start + 1);
}

// field width includes the terminating NUL
void PutOctal(char* field, size_t width, uint64_t value) {
  snprintf(field, width, "%0*llo", (int)width - 1, (unsigned long long)value);
}

void PutString(char* field, size_t width, const std::string& str) {
  memcpy(field, str.data(), std::min(width, str.size()));
}

void Pad(std::string& out) {
  if (out.size() % kBlockSize) out.append(kBlockSize - out.size() % kBlockSize, '\0');
}

// "<len> key=value\n", where len counts the whole record
std::string PaxRecord(const std::string& key, const std::string& value) {
  std::string body = " " + key + "=" + value + "\n";
  size_t digits = std::to_string(body.size()).size();
  while (std::to_string(body.size() + digits).size() != digits) digits++;
  return std::to_string(body.size() + digits) + body;
}

class TarWriter {
  std::string out_;
  size_t entries_ = 0;

  void Header(const std::string& name, char type, unsigned mode, uint64_t size,
              const std::string& link) {
    char block[kBlockSize] = {};
    PutString(block, 100, name);
    PutOctal(block + 100, 8, mode);
    PutOctal(block + 108, 8, 0);
    PutOctal(block + 116, 8, 0);
    PutOctal(block + 124, 12, size);
    PutOctal(block + 136, 12, kEntryMtime);
    memset(block + 148, ' ', 8);
    block[156] = type;
    PutString(block + 157, 100, link);
    memcpy(block + 257, "ustar", 6);
    memcpy(block + 263, "00", 2);
    unsigned sum = 0;
    for (size_t i = 0; i < kBlockSize; i++) sum += (unsigned char)block[i];
    snprintf(block + 148, 8, "%06o", sum);
    block[155] = ' ';
    out_.append(block, kBlockSize);
  }

 public:
  void Add(const std::string& name, char type, unsigned mode, const std::string& data,
           const std::string& link = "") {
    if (data.size() > kMaxEntrySize) {
      throw ConfigurationError("Build context file too large: " + name);
    }
    std::string pax;
    if (name.size() > 100) pax += PaxRecord("path", name);
    if (link.size() > 100) pax += PaxRecord("linkpath", link);
    if (!pax.empty()) {
      Header("././@PaxHeader", 'x', 0644, pax.size(), "");
      out_ += pax;
      Pad(out_);
    }
    Header(name, type, mode, data.size(), link);
    out_ += data;
    Pad(out_);
    entries_++;
  }

  size_t entries() const { return entries_; }
  std::string Finish() {
    out_.append(2 * kBlockSize, '\0');
    return std::move(out_);
  }
};

} // namespace

IgnoreRules::IgnoreRules(const std::string& dockerignore) {
  size_t pos = 0;
  while (pos <= dockerignore.size()) {
    size_t end = dockerignore.find('\n', pos);
    if (end == std::string::npos) end = dockerignore.size();
    std::string line = Trim(dockerignore.substr(pos, end - pos));
    pos = end + 1;
    if (line.empty() || line[0] == '#') continue;
    Rule rule{line, false};
    if (rule.pattern[0] == '!') {
      rule.negate = true;
      rule.pattern = Trim(rule.pattern.substr(1));
    }
    while (rule.pattern.compare(0, 2, "./") == 0) rule.pattern.erase(0, 2);
    while (!rule.pattern.empty() && rule.pattern[0] == '/') rule.pattern.erase(0, 1);
    while (!rule.pattern.empty() && rule.pattern.back() == '/') rule.pattern.pop_back();
    if (!rule.pattern.empty()) rules_.push_back(std::move(rule));
  }
}

bool IgnoreRules::Excluded(const std::string& relpath) const {
  bool excluded = false;
  for (auto& rule : rules_) {
    // the path itself or any of its parent directories
    for (size_t end = relpath.find('/'); ; end = relpath.find('/', end + 1)) {
      std::string prefix = relpath.substr(0, end);
      if (fnmatch(rule.pattern.c_str(), prefix.c_str(), FNM_PATHNAME) == 0) {
        excluded = !rule.negate;
        break;
      }
      if (end == std::string::npos) break;
    }
  }
  return excluded;
}

std::string Sha256Hex(const std::string& data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr)) {
    throw RemexError("SHA-256 digest failed");
  }
  std::string ret;
  for (unsigned i = 0; i < len; i++) ret += fmt::format("{:02x}", md[i]);
  return ret;
}

BuildContext PackBuildContext(const fs::path& root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw ConfigurationError("Build context " + root.string() + " is not a directory");
  }
  IgnoreRules ignore;
  if (auto rules = ReadFileToString(root / ".dockerignore")) ignore = IgnoreRules(*rules);

  std::vector<fs::path> paths;
  fs::recursive_directory_iterator it(root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    std::string rel = it->path().lexically_relative(root).generic_string();
    if (ignore.Excluded(rel)) continue;
    paths.push_back(it->path());
  }
  if (ec) {
    throw ConfigurationError("Cannot walk build context " + root.string() + ": " + ec.message());
  }
  std::sort(paths.begin(), paths.end());

  TarWriter tar;
  for (auto& path : paths) {
    std::string rel = path.lexically_relative(root).generic_string();
    auto status = fs::symlink_status(path, ec);
    if (ec) throw ConfigurationError("Cannot stat " + path.string() + ": " + ec.message());
    unsigned mode = (unsigned)status.permissions() & 07777;
    switch (status.type()) {
      case fs::file_type::directory:
        tar.Add(rel + "/", '5', mode, "");
        break;
      case fs::file_type::symlink: {
        fs::path target = fs::read_symlink(path, ec);
        if (ec) throw ConfigurationError("Cannot read link " + path.string() + ": " + ec.message());
        tar.Add(rel, '2', 0777, "", target.string());
        break;
      }
      case fs::file_type::regular: {
        auto data = ReadFileToString(path);
        if (!data) throw ConfigurationError("Cannot read " + path.string());
        tar.Add(rel, '0', mode, *data);
        break;
      }
      default:
        spdlog::debug("Skipping special file {} in build context", rel);
        break;
    }
  }
  BuildContext ret;
  ret.entries = tar.entries();
  ret.archive = tar.Finish();
  ret.sha256 = Sha256Hex(ret.archive);
  return ret;
}
