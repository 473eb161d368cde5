#pragma once

namespace streamledger::db {

/*
  Unit of work over the ledger store.

  A ledger call opens one transaction, reads the stream and counter rows,
  stages its writes, asks custody to move funds and only then commits.
  Anything that fails before Commit() leaves the store as it was.

    memory  -> private snapshot, version-checked swap on commit
    sqlite  -> BEGIN IMMEDIATE on the shared connection

  Destroying an unfinished transaction rolls it back.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Publishes staged writes. Throws if the backend refuses.
  virtual void Commit() = 0;

  // Drops staged writes. No-op once finished.
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace streamledger::db
