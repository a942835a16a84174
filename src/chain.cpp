// =============================================================================
// chain.cpp - In-process execution environment
// =============================================================================

#include "nftmart/chain.hpp"
#include "nftmart/tokens.hpp"

#include <algorithm>

namespace nftmart {

// =============================================================================
// Contract
// =============================================================================

Contract::Contract(Chain& chain, const Address& address)
    : chain_(chain), address_(address) {
    chain_.register_contract(this);
}

Contract::~Contract() {
    chain_.unregister_contract(this);
}

bool Contract::supports_interface(uint32_t interface_id) const {
    return interface_id == interfaces::ERC165;
}

void Contract::receive(const CallContext&) {}

bool Contract::on_erc721_received(const Address&, const Address&, TokenId) {
    return true;
}

bool Contract::on_erc1155_received(const Address&, const Address&, TokenId, Amount) {
    return true;
}

// =============================================================================
// Accounts
// =============================================================================

Amount Chain::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

void Chain::mint_native(const Address& account, Amount amount) {
    Amount& balance = balances_[account];
    if (balance > AMOUNT_MAX - amount) {
        throw ExecutionError("Chain: native supply overflow");
    }
    balance += amount;
}

void Chain::move_native(const Address& from, const Address& to, Amount amount) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        throw ExecutionError("Chain: insufficient native balance for " + to_hex(from));
    }
    it->second -= amount;
    balances_[to] += amount;
}

void Chain::send_native(const Address& from, const Address& to, Amount amount) {
    move_native(from, to, amount);

    if (Contract* recipient = contract_at(to)) {
        recipient->receive(CallContext{from, amount});
    }
}

Address Chain::allocate_address() {
    return address_from_u64(next_address_++);
}

// =============================================================================
// Contracts
// =============================================================================

Contract* Chain::contract_at(const Address& addr) const {
    auto it = contracts_.find(addr);
    return it != contracts_.end() ? it->second : nullptr;
}

void Chain::register_contract(Contract* contract) {
    if (is_zero(contract->address())) {
        throw ExecutionError("Chain: cannot deploy to the zero address");
    }
    if (!contracts_.emplace(contract->address(), contract).second) {
        throw ExecutionError("Chain: address already in use " + to_hex(contract->address()));
    }
    deploy_order_.push_back(contract);
}

void Chain::unregister_contract(Contract* contract) {
    auto it = contracts_.find(contract->address());
    if (it != contracts_.end() && it->second == contract) {
        contracts_.erase(it);
    }
    deploy_order_.erase(std::remove(deploy_order_.begin(), deploy_order_.end(), contract),
                        deploy_order_.end());
}

// =============================================================================
// Execution
// =============================================================================

void Chain::begin_transaction() {
    tx_owner_.store(std::this_thread::get_id());
    in_transaction_ = true;
}

void Chain::end_transaction() {
    in_transaction_ = false;
    tx_owner_.store(std::thread::id{});
}

Chain::Snapshot Chain::take_snapshot() {
    Snapshot snapshot;
    snapshot.balances = balances_;
    snapshot.rollbacks.reserve(deploy_order_.size());
    for (Contract* contract : deploy_order_) {
        snapshot.rollbacks.push_back(contract->checkpoint());
    }
    snapshot.pending_logs = pending_logs_.size();
    return snapshot;
}

void Chain::restore(Snapshot& snapshot) {
    balances_ = std::move(snapshot.balances);
    for (auto& rollback : snapshot.rollbacks) {
        rollback();
    }
    pending_logs_.resize(snapshot.pending_logs);
}

std::exception_ptr Chain::try_call(const std::function<void()>& fn) {
    Snapshot snapshot = take_snapshot();
    try {
        fn();
        return nullptr;
    } catch (...) {
        restore(snapshot);
        return std::current_exception();
    }
}

std::exception_ptr Chain::static_call(const std::function<void()>& fn) const {
    try {
        fn();
        return nullptr;
    } catch (...) {
        return std::current_exception();
    }
}

// =============================================================================
// Events
// =============================================================================

void Chain::emit(const Address& emitter, std::string event, nlohmann::json data) {
    LogEntry entry;
    entry.index = 0;  // assigned at commit
    entry.emitter = emitter;
    entry.event = std::move(event);
    entry.data = std::move(data);
    pending_logs_.push_back(std::move(entry));
}

size_t Chain::commit() {
    size_t first = logs_.size();
    for (auto& entry : pending_logs_) {
        entry.index = logs_.size();
        logs_.push_back(std::move(entry));
    }
    pending_logs_.clear();
    return first;
}

void Chain::notify_listeners(size_t first) {
    for (size_t i = first; i < logs_.size(); ++i) {
        for (LogListener* listener : listeners_) {
            listener->on_log(logs_[i]);
        }
    }
}

void Chain::add_listener(LogListener* listener) {
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Chain::remove_listener(LogListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

} // namespace nftmart
