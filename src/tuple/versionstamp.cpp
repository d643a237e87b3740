#include "tuplekey/tuple/versionstamp.hpp"

#include "tuple/big_endian.hpp"
#include "tuplekey/base/error.hpp"
#include "tuplekey/base/hex.hpp"

#include <format>
#include <string>

namespace tuplekey {

Result<CompleteVersionStamp> CompleteVersionStamp::FromBytes(Slice bytes) {
  if (bytes.size() != kSize) {
    return Error::InvalidArgument(
        std::format("versionstamp must be {} bytes, got {}", kSize, bytes.size()));
  }
  return CompleteVersionStamp(FromBigEndian(bytes.data(), 8),
                              static_cast<uint16_t>(FromBigEndian(bytes.data() + 8, 2)),
                              static_cast<uint16_t>(FromBigEndian(bytes.data() + 10, 2)));
}

Result<CompleteVersionStamp> CompleteVersionStamp::FromCommitVersion(Slice commit_version,
                                                                     uint16_t user_version) {
  if (commit_version.size() != kCommitVersionSize) {
    return Error::InvalidArgument(std::format("commit versionstamp must be {} bytes, got {}",
                                              kCommitVersionSize, commit_version.size()));
  }
  return CompleteVersionStamp(FromBigEndian(commit_version.data(), 8),
                              static_cast<uint16_t>(FromBigEndian(commit_version.data() + 8, 2)),
                              user_version);
}

void CompleteVersionStamp::EncodeTo(std::string& dest) const {
  AppendBigEndian(dest, tx_version_, 8);
  AppendBigEndian(dest, batch_number_, 2);
  AppendBigEndian(dest, user_version_, 2);
}

std::string CompleteVersionStamp::ToString() const {
  return std::format("Versionstamp({}, {})", ToHex(ToBytes().substr(0, kCommitVersionSize)),
                     user_version_);
}

void IncompleteVersionStamp::EncodeTo(std::string& dest) const {
  dest.append(CompleteVersionStamp::kCommitVersionSize, static_cast<char>(kPlaceholderByte));
  AppendBigEndian(dest, user_version_, 2);
}

std::string IncompleteVersionStamp::ToString() const {
  return std::format("Versionstamp(<incomplete>, {})", user_version_);
}

} // namespace tuplekey
