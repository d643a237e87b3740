#pragma once

#include "tuplekey/base/result.hpp"
#include "tuplekey/base/slice.hpp"

#include <compare>
#include <cstdint>
#include <string>

namespace tuplekey {

/// A versionstamp assigned by the database to a committed transaction: the
/// 8-byte commit version and 2-byte batch number of the transaction, followed
/// by a 2-byte user version chosen by the writer to order keys written within
/// the same transaction.
class CompleteVersionStamp {
public:
  /// Size of the encoded stamp.
  static constexpr size_t kSize = 12;

  /// Size of the database assigned part, i.e. transaction version and batch
  /// number.
  static constexpr size_t kCommitVersionSize = 10;

  CompleteVersionStamp() = default;

  CompleteVersionStamp(uint64_t tx_version, uint16_t batch_number, uint16_t user_version)
      : tx_version_(tx_version),
        batch_number_(batch_number),
        user_version_(user_version) {
  }

  /// Parses a 12-byte big-endian stamp.
  static Result<CompleteVersionStamp> FromBytes(Slice bytes);

  /// Builds a stamp from the 10-byte commit versionstamp reported by a
  /// committed transaction and the user version the writer used.
  static Result<CompleteVersionStamp> FromCommitVersion(Slice commit_version,
                                                        uint16_t user_version);

  uint64_t TxVersion() const {
    return tx_version_;
  }

  uint16_t BatchNumber() const {
    return batch_number_;
  }

  uint16_t UserVersion() const {
    return user_version_;
  }

  /// Appends the 12-byte big-endian encoding to dest.
  void EncodeTo(std::string& dest) const;

  /// Returns the 12-byte big-endian encoding.
  std::string ToBytes() const {
    std::string bytes;
    EncodeTo(bytes);
    return bytes;
  }

  std::string ToString() const;

  /// Stamps order by transaction version, then batch number, then user version.
  friend auto operator<=>(const CompleteVersionStamp&, const CompleteVersionStamp&) = default;

private:
  uint64_t tx_version_ = 0;
  uint16_t batch_number_ = 0;
  uint16_t user_version_ = 0;
};

/// A versionstamp written before commit. Only the user version is known, the
/// database fills in the transaction version and batch number of the
/// committing transaction.
class IncompleteVersionStamp {
public:
  /// Value of each placeholder byte written in place of the commit version.
  static constexpr uint8_t kPlaceholderByte = 0xFF;

  IncompleteVersionStamp() = default;

  explicit IncompleteVersionStamp(uint16_t user_version) : user_version_(user_version) {
  }

  uint16_t UserVersion() const {
    return user_version_;
  }

  /// Appends ten placeholder bytes followed by the big-endian user version.
  void EncodeTo(std::string& dest) const;

  /// Returns the stamp the database writes once the enclosing transaction
  /// committed with the given version and batch number.
  CompleteVersionStamp Complete(uint64_t tx_version, uint16_t batch_number) const {
    return CompleteVersionStamp(tx_version, batch_number, user_version_);
  }

  std::string ToString() const;

  friend auto operator<=>(const IncompleteVersionStamp&, const IncompleteVersionStamp&) = default;

private:
  uint16_t user_version_ = 0;
};

} // namespace tuplekey
