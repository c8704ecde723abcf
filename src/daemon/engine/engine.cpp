#include "engine.hpp"

#include "../model/model_resolver.hpp"

#include <format>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

Engine::Engine(BackendFactory factory)
    : factory_(std::move(factory)) {}

std::expected<void, Error> Engine::acquire(std::unique_lock<std::mutex>& lock) const {
    try {
        lock.lock();
    } catch (const std::system_error& e) {
        return std::unexpected(Error{ErrorKind::Lock,
            std::format("Failed to lock engine state: {}", e.what())});
    }
    return {};
}

std::expected<std::string, Error> Engine::load(const std::filesystem::path& path) {
    auto resolved = resolve_model(path);
    if (!resolved) return std::unexpected(resolved.error());
    return load(*resolved);
}

std::expected<std::string, Error> Engine::load(const ResolvedModel& resolved) {
    std::unique_lock lock(mutex_, std::defer_lock);
    if (auto locked = acquire(lock); !locked) return std::unexpected(locked.error());

    auto backend = factory_(resolved.descriptor);
    if (!backend) return std::unexpected(backend.error());

    state_ = std::visit(overloaded{
        [&](const EmbeddedModel& m) -> EngineState {
            return EmbeddedEngine{m.path, std::move(*backend)};
        },
        [&](const ExternalModel& m) -> EngineState {
            return ExternalEngine{m, std::move(*backend)};
        },
    }, resolved.descriptor);
    label_ = resolved.label;
    return label_;
}

std::expected<std::string, Error> Engine::current_label() const {
    std::unique_lock lock(mutex_, std::defer_lock);
    if (auto locked = acquire(lock); !locked) return std::unexpected(locked.error());
    return label_;
}

std::expected<std::string, Error> Engine::transcribe(std::span<const float> audio) {
    auto result = transcribe_labeled(audio);
    if (!result) return std::unexpected(result.error());
    return std::move(result->text);
}

std::expected<Transcript, Error> Engine::transcribe_labeled(std::span<const float> audio) {
    std::unique_lock lock(mutex_, std::defer_lock);
    if (auto locked = acquire(lock); !locked) return std::unexpected(locked.error());

    auto text = std::visit(overloaded{
        [](Unloaded&) -> std::expected<std::string, Error> {
            return std::unexpected(Error{ErrorKind::NoEngineLoaded, "No model loaded"});
        },
        [audio](auto& active) -> std::expected<std::string, Error> {
            return active.backend->transcribe(audio);
        },
    }, state_);
    if (!text) return std::unexpected(text.error());
    return Transcript{std::move(*text), label_};
}
