//
// The contexts that flat_map injects automatically.
//

#ifndef DELTAFLOW_CONTEXT_REGISTRY_H
#define DELTAFLOW_CONTEXT_REGISTRY_H

#include <deltaflow/deltaflow_export.h>
#include <deltaflow/deltaflow_forward_declarations.h>
#include <deltaflow/types/record.h>

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace deltaflow {
    /**
     * An explicit set of context collections. flat_map captures a snapshot of a registry when it is called,
     * a context added later (or removed later) does not affect collections already built.
     *
     * ContextRegistry::instance() is the default registry of the calling thread, it is what Context and
     * flat_map use when no registry is passed. Create a registry of your own to keep a group of contexts
     * isolated from the default one.
     */
    class DELTAFLOW_EXPORT ContextRegistry {
    public:
        using context_ptr = std::shared_ptr<Collection<Record>>;

        ContextRegistry() = default;

        ContextRegistry(const ContextRegistry &) = delete;

        ContextRegistry &operator=(const ContextRegistry &) = delete;

        static ContextRegistry &instance();

        /**
         * Register a context collection, it stays registered until the returned registration is released.
         */
        [[nodiscard]] ContextRegistration add(context_ptr context);

        [[nodiscard]] std::vector<context_ptr> snapshot() const;

        [[nodiscard]] std::size_t size() const { return _entries.size(); }

        [[nodiscard]] bool empty() const { return _entries.empty(); }

    private:
        friend class ContextRegistration;

        void remove(std::uint64_t token);

        std::vector<std::pair<std::uint64_t, context_ptr>> _entries;
        std::uint64_t _last_token{0};
    };

    /**
     * Keeps a context registered, releases the registration when destroyed.
     */
    class DELTAFLOW_EXPORT ContextRegistration {
    public:
        ContextRegistration() = default;

        ContextRegistration(const ContextRegistration &) = delete;

        ContextRegistration &operator=(const ContextRegistration &) = delete;

        ContextRegistration(ContextRegistration &&other) noexcept;

        ContextRegistration &operator=(ContextRegistration &&other) noexcept;

        ~ContextRegistration();

        void release() noexcept;

        [[nodiscard]] bool active() const noexcept { return _registry != nullptr; }

    private:
        friend class ContextRegistry;

        ContextRegistration(ContextRegistry *registry, std::uint64_t token) : _registry{registry}, _token{token} {}

        ContextRegistry *_registry{nullptr};
        std::uint64_t _token{0};
    };
} // namespace deltaflow

#endif  // DELTAFLOW_CONTEXT_REGISTRY_H
