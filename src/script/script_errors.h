/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>

namespace romc::script {
class ScriptError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Blob matches no known encoding.
class FormatError : public ScriptError {
   public:
    using ScriptError::ScriptError;
};

// Bad key length or buffer not aligned to the cipher block size.
class CipherError : public ScriptError {
   public:
    using ScriptError::ScriptError;
};

// Native library or external tool could not be found or loaded. Recoverable by trying
// another strategy.
class RuntimeUnavailable : public ScriptError {
   public:
    using ScriptError::ScriptError;
};

// Interpreter was available but failed: load/pcall error, or target global missing or not a
// table. Another strategy would hit the same fault.
class RuntimeFault : public ScriptError {
   public:
    using ScriptError::ScriptError;
};

// External process ran but exited non-zero or produced unusable output.
class ToolFailure : public ScriptError {
   public:
    using ScriptError::ScriptError;
};
}  // namespace romc::script
