#pragma once

#include "../error.hpp"
#include "model_descriptor.hpp"

#include <expected>
#include <filesystem>

// Inspects a model location and decides which engine and layout it holds.
//
//   file                        -> EmbeddedModel
//   dir/tokens.txt missing      -> MissingTokens
//   dir/model.int8.onnx         -> SenseVoice
//   dir/{encoder,decoder}       -> WhisperStyle, or Transducer when a joiner exists
//
// For encoder, decoder and joiner the "*.int8.onnx" file wins over "*.onnx".
// The label is the base name of the file or directory.
std::expected<ResolvedModel, Error> resolve_model(const std::filesystem::path& path);
