#pragma once

#include <string>

enum class ErrorKind {
    Format,
    SampleRate,
    Channel,
    ModelNotFound,
    MissingTokens,
    MissingComponent,
    ModelInit,
    Session,
    Decode,
    BinaryNotFound,
    ProcessExecution,
    ProcessExit,
    Io,
    Lock,
    NoEngineLoaded,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

constexpr const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Format: return "FormatError";
        case ErrorKind::SampleRate: return "SampleRateError";
        case ErrorKind::Channel: return "ChannelError";
        case ErrorKind::ModelNotFound: return "ModelNotFoundError";
        case ErrorKind::MissingTokens: return "MissingTokensError";
        case ErrorKind::MissingComponent: return "MissingComponentError";
        case ErrorKind::ModelInit: return "ModelInitError";
        case ErrorKind::Session: return "SessionError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::BinaryNotFound: return "BinaryNotFoundError";
        case ErrorKind::ProcessExecution: return "ProcessExecutionError";
        case ErrorKind::ProcessExit: return "ProcessExitError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Lock: return "LockError";
        case ErrorKind::NoEngineLoaded: return "NoEngineLoadedError";
    }
    return "UnknownError";
}
