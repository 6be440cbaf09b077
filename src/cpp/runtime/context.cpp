#include <deltaflow/nodes/operators.h>
#include <deltaflow/runtime/context.h>
#include <deltaflow/util/errors.h>

#include <algorithm>
#include <stdexcept>

namespace deltaflow {
    namespace {
        std::shared_ptr<Collection<Record>> combine(const Context::named_inputs_type &inputs) {
            if (inputs.empty()) { return Collection<Record>::from({Record{}}); }

            const auto &[first_name, first_input] = inputs.front();
            std::shared_ptr<Collection<Record>> combined =
                first_input->map([name = first_name](const Value &value) { return Record{}.with(name, value); });

            for (auto it = std::next(inputs.begin()); it != inputs.end(); ++it) {
                combined = combined->with_latest(it->second)->map(
                    [name = it->first](const std::pair<Record, Value> &pair) { return pair.first.with(name, pair.second); });
            }
            return combined->with_label("context");
        }
    } // namespace

    Context::Context(named_inputs_type inputs, ContextRegistry &registry) {
        for (const auto &[name, input]: inputs) {
            if (!input) { throw_error<std::invalid_argument>("Context input '{}' is null", name); }
            if (std::find(_names.begin(), _names.end(), name) != _names.end()) {
                throw_error<std::invalid_argument>("Context input '{}' is given more than once", name);
            }
            _names.push_back(name);
        }

        _combined = combine(inputs);
        _tracker = _combined->subscribe([this](const Record &record, Delta delta) {
            if (delta == Delta::Insert) { _current = record; }
        });
        _registration = registry.add(_combined);
    }

    Context::~Context() {
        dispose();
        _tracker.unsubscribe();
    }

    void Context::dispose() {
        if (_disposed) { return; }
        _disposed = true;
        _registration.release();
    }
} // namespace deltaflow
