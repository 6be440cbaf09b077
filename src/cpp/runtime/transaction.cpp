#include <deltaflow/runtime/observers/dataflow_observer.h>
#include <deltaflow/runtime/transaction.h>
#include <deltaflow/util/errors.h>

#include <utility>

namespace deltaflow {
    TransactionScheduler &TransactionScheduler::instance() {
        thread_local TransactionScheduler scheduler;
        return scheduler;
    }

    void TransactionScheduler::schedule(emit_fn emit) {
        if (is_batching()) {
            _pending.push_back(std::move(emit));
        } else {
            emit();
        }
    }

    void TransactionScheduler::begin() {
        ++_depth;
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) { observers.on_transaction_begin(_depth); }
    }

    void TransactionScheduler::end() {
        if (_depth == 0) { throw_error("TransactionScheduler::end called without a matching begin"); }
        if (--_depth == 0) { _flush(); }
    }

    void TransactionScheduler::_flush() {
        if (_pending.empty()) { return; }
        // Emissions scheduled by subscribers during the flush are not part of the transaction, they run immediately.
        auto batch = std::exchange(_pending, {});
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) {
            observers.on_transaction_flush(batch.size());
        }
        const bool was_flushing = std::exchange(_flushing, true);
        try {
            for (auto &emit: batch) { emit(); }
        } catch (...) {
            _flushing = was_flushing;
            throw;
        }
        _flushing = was_flushing;
    }
} // namespace deltaflow
