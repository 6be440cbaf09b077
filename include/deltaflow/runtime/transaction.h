//
// Transactions batch the emissions of Input mutations.
//

#ifndef DELTAFLOW_TRANSACTION_H
#define DELTAFLOW_TRANSACTION_H

#include <deltaflow/deltaflow_export.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <utility>

namespace deltaflow {
    /**
     * Every Input mutation hands its emission to the scheduler of the current thread. Outside of a transaction
     * the emission runs immediately; inside one it is queued, and the queue is flushed in scheduling order when
     * the outermost transaction ends.
     *
     * Transactions nest: the scheduler keeps a depth counter, an inner transaction ending does not flush.
     * Membership changes of an Input are applied immediately, only the delivery to subscribers is deferred.
     */
    class DELTAFLOW_EXPORT TransactionScheduler {
    public:
        using emit_fn = std::function<void()>;

        static TransactionScheduler &instance();

        /**
         * Queue the emission when a transaction is open, run it now otherwise.
         */
        void schedule(emit_fn emit);

        void begin();

        /**
         * Close the innermost transaction, flushing the queue when it was the outermost one.
         * If a queued emission throws the exception propagates and the emissions queued after it are discarded.
         */
        void end();

        [[nodiscard]] bool is_batching() const { return _depth > 0; }

        [[nodiscard]] bool is_flushing() const { return _flushing; }

        [[nodiscard]] std::size_t depth() const { return _depth; }

        [[nodiscard]] std::size_t pending() const { return _pending.size(); }

    private:
        void _flush();

        std::size_t _depth{0};
        bool _flushing{false};
        std::deque<emit_fn> _pending;
    };

    /**
     * The single choke point used by Input mutations.
     */
    inline void schedule_emit(TransactionScheduler::emit_fn emit) {
        TransactionScheduler::instance().schedule(std::move(emit));
    }

    [[nodiscard]] inline bool is_batching() { return TransactionScheduler::instance().is_batching(); }

    /**
     * Run fn inside a transaction. The queued emissions are flushed when fn returns, and also when it throws,
     * in which case the exception is rethrown after the flush.
     */
    template<typename Fn>
    void tx(Fn &&fn) {
        auto &scheduler = TransactionScheduler::instance();
        scheduler.begin();
        try {
            std::forward<Fn>(fn)();
        } catch (...) {
            scheduler.end();
            throw;
        }
        scheduler.end();
    }
} // namespace deltaflow

#endif  // DELTAFLOW_TRANSACTION_H
