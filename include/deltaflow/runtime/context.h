//
// Context - named inputs merged into one reactive record.
//

#ifndef DELTAFLOW_CONTEXT_H
#define DELTAFLOW_CONTEXT_H

#include <deltaflow/runtime/context_registry.h>
#include <deltaflow/types/input.h>
#include <deltaflow/types/record.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deltaflow {
    /**
     * A Context merges N named inputs into one Collection<Record>: the first input seeds the record, every
     * further input is paired in with with_latest and merged into it. The combined collection is registered
     * with a ContextRegistry, so flat_map calls made while the context is registered re-run their function
     * for every live item each time the record changes.
     *
     * The most recent record is tracked by an internal subscription and can be read synchronously through
     * get() / operator[], which is how a flat_map function reads the context it was re-run for.
     *
     * dispose() removes the registration: flat_maps built afterwards no longer see this context, those built
     * before keep the collection they captured. The current record is tracked until the Context is destroyed.
     */
    class DELTAFLOW_EXPORT Context {
    public:
        using input_type = Input<Value>;
        using named_inputs_type = std::vector<std::pair<std::string, input_ptr<Value>>>;

        explicit Context(named_inputs_type inputs, ContextRegistry &registry = ContextRegistry::instance());

        Context(const Context &) = delete;

        Context &operator=(const Context &) = delete;

        ~Context();

        /**
         * The most recently observed record.
         */
        [[nodiscard]] const Record &current() const { return _current; }

        /**
         * The current value of field name, none when the input has no value yet.
         */
        [[nodiscard]] Value get(std::string_view name) const { return _current.value_or_none(name); }

        /**
         * The current value of field name as T.
         * @throws std::out_of_range when the input has no value yet, bad_value_type on a type mismatch
         */
        template<typename T>
        [[nodiscard]] const T &get(std::string_view name) const {
            return _current.get<T>(name);
        }

        [[nodiscard]] Value operator[](std::string_view name) const { return get(name); }

        [[nodiscard]] const std::shared_ptr<Collection<Record>> &combined() const { return _combined; }

        [[nodiscard]] const std::vector<std::string> &names() const { return _names; }

        /**
         * Remove the registration. Idempotent.
         */
        void dispose();

        [[nodiscard]] bool disposed() const { return _disposed; }

    private:
        std::vector<std::string> _names;
        std::shared_ptr<Collection<Record>> _combined;
        Record _current;
        Subscription _tracker;
        ContextRegistration _registration;
        bool _disposed{false};
    };
} // namespace deltaflow

#endif  // DELTAFLOW_CONTEXT_H
