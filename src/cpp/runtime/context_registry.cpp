#include <deltaflow/runtime/context_registry.h>
#include <deltaflow/types/collection.h>
#include <deltaflow/util/errors.h>

#include <algorithm>
#include <stdexcept>

namespace deltaflow {
    ContextRegistry &ContextRegistry::instance() {
        thread_local ContextRegistry registry;
        return registry;
    }

    ContextRegistration ContextRegistry::add(context_ptr context) {
        if (!context) { throw_error<std::invalid_argument>("Cannot register a null context collection"); }
        auto token = ++_last_token;
        _entries.emplace_back(token, std::move(context));
        return ContextRegistration{this, token};
    }

    std::vector<ContextRegistry::context_ptr> ContextRegistry::snapshot() const {
        std::vector<context_ptr> result;
        result.reserve(_entries.size());
        for (const auto &[_, context]: _entries) { result.push_back(context); }
        return result;
    }

    void ContextRegistry::remove(std::uint64_t token) {
        auto it = std::find_if(_entries.begin(), _entries.end(), [token](const auto &e) { return e.first == token; });
        if (it != _entries.end()) { _entries.erase(it); }
    }

    ContextRegistration::ContextRegistration(ContextRegistration &&other) noexcept
        : _registry{std::exchange(other._registry, nullptr)}, _token{other._token} {}

    ContextRegistration &ContextRegistration::operator=(ContextRegistration &&other) noexcept {
        if (this != &other) {
            release();
            _registry = std::exchange(other._registry, nullptr);
            _token = other._token;
        }
        return *this;
    }

    ContextRegistration::~ContextRegistration() { release(); }

    void ContextRegistration::release() noexcept {
        if (auto *registry = std::exchange(_registry, nullptr); registry != nullptr) { registry->remove(_token); }
    }
} // namespace deltaflow
