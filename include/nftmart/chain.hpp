#ifndef NFTMART_CHAIN_HPP
#define NFTMART_CHAIN_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace nftmart {

class Chain;

// msg.sender / msg.value of the current call frame
struct CallContext {
    Address sender;
    Amount value = 0;
};

// Failure of the execution environment itself (balance, dispatch, hooks)
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Event Log
// =============================================================================

struct LogEntry {
    uint64_t index;
    Address emitter;
    std::string event;
    nlohmann::json data;
};

// Callback interface for committed log entries
class LogListener {
public:
    virtual ~LogListener() = default;
    virtual void on_log(const LogEntry& entry) = 0;
};

// =============================================================================
// Contract - anything with code at an address
// =============================================================================

class Contract {
public:
    // Restores the state captured by checkpoint()
    using Rollback = std::function<void()>;

    Contract(Chain& chain, const Address& address);
    virtual ~Contract();

    // Non-copyable
    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const Address& address() const { return address_; }
    Chain& chain() const { return chain_; }

    // ERC-165 style capability query
    virtual bool supports_interface(uint32_t interface_id) const;

    // Plain native-value transfer into this contract. Throwing rejects it.
    virtual void receive(const CallContext& ctx);

    // Token receiver hooks; returning false rejects the transfer
    virtual bool on_erc721_received(const Address& op, const Address& from, TokenId token_id);
    virtual bool on_erc1155_received(const Address& op, const Address& from,
                                     TokenId token_id, Amount amount);

    // Capture all mutable state
    virtual Rollback checkpoint() = 0;

private:
    Chain& chain_;
    Address address_;
};

// =============================================================================
// Chain - serialized, all-or-nothing execution environment
// =============================================================================

class Chain {
public:
    Chain() = default;
    ~Chain() = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Accounts
    // =========================================================================

    Amount balance_of(const Address& account) const;

    // Genesis funding
    void mint_native(const Address& account, Amount amount);

    // Value transfer; runs the recipient's receive hook if it is a contract
    void send_native(const Address& from, const Address& to, Amount amount);

    // Fresh deterministic address for a contract deployment
    Address allocate_address();

    // =========================================================================
    // Contracts
    // =========================================================================

    Contract* contract_at(const Address& addr) const;
    bool is_contract(const Address& addr) const { return contract_at(addr) != nullptr; }

    // Contract at addr if it advertises interface_id, otherwise nullptr
    template<typename Interface>
    Interface* interface_at(const Address& addr, uint32_t interface_id) const {
        Contract* c = contract_at(addr);
        if (!c || !c->supports_interface(interface_id)) return nullptr;
        return dynamic_cast<Interface*>(c);
    }

    // =========================================================================
    // Execution
    // =========================================================================

    // Top-level transaction. value moves from sender to target before fn runs;
    // any exception restores every balance, contract state and pending log.
    template<typename Fn>
    auto transact(const Address& sender, const Address& target, Amount value, Fn&& fn)
        -> std::invoke_result_t<Fn, const CallContext&>;

    // Nested call inside the current transaction (value moves, no receive hook)
    template<typename Fn>
    auto call(const Address& from, const Address& to, Amount value, Fn&& fn)
        -> std::invoke_result_t<Fn, const CallContext&>;

    // Nested call whose failure is contained: its effects are rolled back and
    // the exception is returned instead of propagated. nullptr on success.
    std::exception_ptr try_call(const std::function<void()>& fn);

    // Read-only call: the exception is returned like try_call, but no state is
    // captured, so fn must not mutate anything.
    std::exception_ptr static_call(const std::function<void()>& fn) const;

    bool in_transaction() const { return in_transaction_; }

    // =========================================================================
    // Events
    // =========================================================================

    void emit(const Address& emitter, std::string event, nlohmann::json data);

    // Committed entries only
    const std::vector<LogEntry>& logs() const { return logs_; }

    // Listeners run after commit and must not start transactions
    void add_listener(LogListener* listener);
    void remove_listener(LogListener* listener);

private:
    friend class Contract;

    struct Snapshot {
        std::unordered_map<Address, Amount, AddressHash> balances;
        std::vector<Contract::Rollback> rollbacks;
        size_t pending_logs;
    };

    std::unordered_map<Address, Amount, AddressHash> balances_;
    std::unordered_map<Address, Contract*, AddressHash> contracts_;
    std::vector<Contract*> deploy_order_;
    uint64_t next_address_{0xC0DE0000};

    std::vector<LogEntry> pending_logs_;
    std::vector<LogEntry> logs_;
    std::vector<LogListener*> listeners_;

    std::mutex tx_mutex_;
    std::atomic<std::thread::id> tx_owner_{};
    bool in_transaction_{false};

    void register_contract(Contract* contract);
    void unregister_contract(Contract* contract);

    void move_native(const Address& from, const Address& to, Amount amount);

    Snapshot take_snapshot();
    void restore(Snapshot& snapshot);
    // Moves pending entries to the committed log; returns the first new index
    size_t commit();
    void notify_listeners(size_t first);

    void begin_transaction();
    void end_transaction();
};

// =============================================================================
// Template implementations
// =============================================================================

template<typename Fn>
auto Chain::transact(const Address& sender, const Address& target, Amount value, Fn&& fn)
    -> std::invoke_result_t<Fn, const CallContext&> {
    using Result = std::invoke_result_t<Fn, const CallContext&>;

    if (tx_owner_.load() == std::this_thread::get_id()) {
        throw ExecutionError("Chain: transact called inside a transaction");
    }

    std::lock_guard<std::mutex> lock(tx_mutex_);
    begin_transaction();
    Snapshot snapshot = take_snapshot();
    CallContext ctx{sender, value};
    size_t first_committed = 0;

    if constexpr (std::is_void_v<Result>) {
        try {
            if (value > 0) move_native(sender, target, value);
            std::forward<Fn>(fn)(ctx);
            first_committed = commit();
        } catch (...) {
            restore(snapshot);
            end_transaction();
            throw;
        }
        end_transaction();
        notify_listeners(first_committed);
    } else {
        std::optional<Result> result;
        try {
            if (value > 0) move_native(sender, target, value);
            result.emplace(std::forward<Fn>(fn)(ctx));
            first_committed = commit();
        } catch (...) {
            restore(snapshot);
            end_transaction();
            throw;
        }
        end_transaction();
        notify_listeners(first_committed);
        return std::move(*result);
    }
}

template<typename Fn>
auto Chain::call(const Address& from, const Address& to, Amount value, Fn&& fn)
    -> std::invoke_result_t<Fn, const CallContext&> {
    if (value > 0) {
        move_native(from, to, value);
    }
    CallContext ctx{from, value};
    return std::forward<Fn>(fn)(ctx);
}

} // namespace nftmart

#endif // NFTMART_CHAIN_HPP
