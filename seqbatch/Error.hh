#pragma once
#include <stdexcept>
#include <string>

namespace seqbatch {

/// Base of every structural failure raised by seqbatch. Per-record problems
/// (empty or over-long sequences) never throw, they are skipped and logged at
/// the point of ingestion.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// A single record is longer than the token budget of a batch.
class BatchOverflowError : public Error {
 public:
  using Error::Error;
};

/// BOS/EOS preconditions violated, or records of one batch disagree on
/// whether they carry a target.
class InvalidAlignmentError : public Error {
 public:
  using Error::Error;
};

class DuplicateIdError : public Error {
 public:
  using Error::Error;
};

class MissingRecordError : public Error {
 public:
  using Error::Error;
};

/// Source and target corpora of a parallel dataset differ in line count.
class CorpusMismatchError : public Error {
 public:
  using Error::Error;
};

/// The requested ordering or bucketing strategy is unknown, or the backend
/// cannot provide it.
class UnsupportedStrategyError : public Error {
 public:
  using Error::Error;
};

class SchemaError : public Error {
 public:
  using Error::Error;
};

/// Non-integer token in a flat file, or an undecodable sequence blob.
class MalformedRecordError : public Error {
 public:
  using Error::Error;
};

class EmptyDatasetError : public Error {
 public:
  using Error::Error;
};

}  // namespace seqbatch
