#pragma once

#include <stdexcept>
#include <string>

class MbootException : public std::runtime_error {
public:
    explicit MbootException(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidTargetException : public MbootException {
public:
    using MbootException::MbootException;
};

class UnsupportedPlatformException : public MbootException {
public:
    using MbootException::MbootException;
};

// Missing tools or unusable host setup (e.g. no elevation helper on PATH)
class EnvironmentException : public MbootException {
public:
    using MbootException::MbootException;
};

class NetworkException : public MbootException {
public:
    using MbootException::MbootException;
};

class ManifestException : public MbootException {
public:
    using MbootException::MbootException;
};

class ChecksumMismatchException : public MbootException {
public:
    using MbootException::MbootException;
};

class InstallerNotFoundException : public MbootException {
public:
    using MbootException::MbootException;
};

class AmbiguousInstallerException : public MbootException {
public:
    using MbootException::MbootException;
};

class ElevationTimeoutException : public MbootException {
public:
    using MbootException::MbootException;
};

class ElevationFailedException : public MbootException {
public:
    using MbootException::MbootException;
};

class InterruptedException : public MbootException {
public:
    InterruptedException(const std::string& message, int signal)
        : MbootException(message), signal_(signal) {}

    int signal() const { return signal_; }

private:
    int signal_;
};

// The nested installer ran and reported failure; its code becomes ours.
class InstallerExitException : public MbootException {
public:
    InstallerExitException(const std::string& message, int exit_code)
        : MbootException(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};
