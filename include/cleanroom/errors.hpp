#pragma once
#include <stdexcept>
#include <string>

namespace cleanroom {

// Base of every failure the pipeline raises.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Missing/malformed config, unknown remote, empty tracked set, bad exclude path.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Copy/read/write failure while building or transforming the snapshot.
class IoError : public Error {
public:
  using Error::Error;
};

// History creation failed or the remote rejected the push.
class PublishError : public Error {
public:
  using Error::Error;
};

} // namespace cleanroom
