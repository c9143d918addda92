#pragma once

#include <stdexcept>
#include <string>

namespace duet {

// ============================================================================
// Error taxonomy
// Every error raised by the core derives from DuetError so request handlers
// can map them with a single catch chain.
// ============================================================================

class DuetError : public std::runtime_error {
public:
    explicit DuetError(const std::string& what) : std::runtime_error(what) {}
};

// Self-conversation attempt, rejected before any write
class InvalidParticipants : public DuetError {
public:
    explicit InvalidParticipants(const std::string& what) : DuetError(what) {}
};

class NotFound : public DuetError {
public:
    explicit NotFound(const std::string& what) : DuetError(what) {}
};

// Non-retryable storage failure (bad schema, constraint violation, corrupt row)
class StorageError : public DuetError {
public:
    explicit StorageError(const std::string& what) : DuetError(what) {}
};

// Storage failure that may succeed when retried
class TransientStorageError : public StorageError {
public:
    explicit TransientStorageError(const std::string& what) : StorageError(what) {}
};

// The message could not be made durable; nothing was written to the views
class SendFailed : public DuetError {
public:
    explicit SendFailed(const std::string& what) : DuetError(what) {}
};

// The caller cancelled before the message became durable
class SendCancelled : public DuetError {
public:
    explicit SendCancelled(const std::string& what) : DuetError(what) {}
};

// Tampered, truncated or foreign pagination cursor
class InvalidCursor : public DuetError {
public:
    explicit InvalidCursor(const std::string& what) : DuetError(what) {}
};

} // namespace duet
