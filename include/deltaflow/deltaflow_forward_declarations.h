#ifndef DELTAFLOW_FORWARD_DECLARATIONS_H
#define DELTAFLOW_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <deltaflow/types/value_hash.h>

namespace deltaflow {
    enum class Delta : std::int8_t;

    template<typename T>
    struct Change;

    // Node - the untyped face of every collection, used by observers
    class Node;
    using node_ptr = Node *;

    // Collections - always owned through shared_ptr
    template<Element T>
    class Collection;

    template<typename T>
    using collection_ptr = std::shared_ptr<Collection<T>>;

    template<Element T>
    class Input;

    template<typename T>
    using input_ptr = std::shared_ptr<Input<T>>;

    class Subscription;

    // Context machinery
    class Record;
    class Context;
    class ContextRegistry;
    class ContextRegistration;

    // Observers - shared between the registry and the caller that installs them
    struct DataflowObserver;
    using dataflow_observer_ptr = DataflowObserver *;
    using dataflow_observer_s_ptr = std::shared_ptr<DataflowObserver>;

    class ObserverRegistry;
    class TransactionScheduler;
    struct DisplayNode;
} // namespace deltaflow

#endif  // DELTAFLOW_FORWARD_DECLARATIONS_H
