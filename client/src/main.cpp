// nftmart scenario runner
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Deploys a marketplace from a JSON config onto a fresh in-process chain and
// replays a JSON scenario of token and marketplace calls against it.

#include <nftmart/nftmart.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace nftmart;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
};

// Malformed scenario document or step
class ScenarioError : public std::runtime_error {
public:
    explicit ScenarioError(const std::string& msg) : std::runtime_error(msg) {}
};

// A well-formed expectation that did not hold
class ExpectationError : public std::runtime_error {
public:
    explicit ExpectationError(const std::string& msg) : std::runtime_error(msg) {}
};

//------------------------------------------------------------------------------
// Event printer
//------------------------------------------------------------------------------

class EventPrinter : public LogListener {
public:
    void on_log(const LogEntry& entry) override {
        json line{
            {"index", entry.index},
            {"emitter", to_hex(entry.emitter)},
            {"event", entry.event},
            {"data", entry.data}
        };
        std::cout << line.dump() << "\n";
    }
};

//------------------------------------------------------------------------------
// Scenario runner
//------------------------------------------------------------------------------

class Scenario {
public:
    Scenario(const MarketConfig& config, LogLevel level)
        : config_(config)
        , level_(level)
        , market_(chain_, chain_.allocate_address(), config)
    {
        if (level_ != LogLevel::Quiet) {
            chain_.add_listener(&printer_);
        }
    }

    ~Scenario() {
        chain_.remove_listener(&printer_);
    }

    void load(const json& doc) {
        if (!doc.is_object()) {
            throw ScenarioError("Scenario must be a JSON object");
        }

        if (doc.contains("accounts")) {
            uint64_t next = 0xA0000;
            for (const auto& item : doc.at("accounts").items()) {
                Address account = address_from_u64(next++);
                names_[item.key()] = account;
                Amount funded = parse_amount(item.value(), "accounts." + item.key());
                if (funded > 0) chain_.mint_native(account, funded);
            }
        }

        if (doc.contains("tokens")) {
            for (const auto& token : doc.at("tokens")) {
                deploy(token);
            }
        }

        if (!doc.contains("steps") || !doc.at("steps").is_array()) {
            throw ScenarioError("Scenario needs a 'steps' array");
        }
        steps_ = doc.at("steps");
    }

    // Returns the number of failed steps
    int run() {
        int failures = 0;
        size_t index = 0;
        for (const auto& step : steps_) {
            ++index;
            if (!run_step(index, step)) ++failures;
        }
        return failures;
    }

private:
    MarketConfig config_;
    LogLevel level_;
    Chain chain_;
    Marketplace market_;
    EventPrinter printer_;

    std::map<std::string, Address> names_;
    std::map<std::string, std::unique_ptr<Erc20Token>> erc20_;
    std::map<std::string, std::unique_ptr<Erc721Collection>> erc721_;
    std::map<std::string, std::unique_ptr<Erc1155Collection>> erc1155_;
    json steps_;

    //--------------------------------------------------------------------------
    // Field parsing
    //--------------------------------------------------------------------------

    static Amount parse_amount(const json& value, const std::string& field) {
        try {
            if (value.is_number_unsigned()) return static_cast<Amount>(value.get<uint64_t>());
            if (value.is_string()) return amount_from_string(value.get<std::string>());
        } catch (const std::exception& e) {
            throw ScenarioError("Field '" + field + "': " + e.what());
        }
        throw ScenarioError("Field '" + field + "' must be a decimal amount");
    }

    static Amount amount_or(const json& step, const char* field, Amount fallback) {
        return step.contains(field) ? parse_amount(step.at(field), field) : fallback;
    }

    static uint64_t u64_or(const json& step, const char* field, uint64_t fallback) {
        if (!step.contains(field)) return fallback;
        const json& value = step.at(field);
        if (!value.is_number_unsigned()) {
            throw ScenarioError(std::string("Field '") + field + "' must be an unsigned integer");
        }
        return value.get<uint64_t>();
    }

    static bool bool_or(const json& step, const char* field, bool fallback) {
        if (!step.contains(field)) return fallback;
        const json& value = step.at(field);
        if (!value.is_boolean()) {
            throw ScenarioError(std::string("Field '") + field + "' must be a boolean");
        }
        return value.get<bool>();
    }

    static std::string string_field(const json& step, const char* field) {
        if (!step.contains(field) || !step.at(field).is_string()) {
            throw ScenarioError(std::string("Field '") + field + "' is required");
        }
        return step.at(field).get<std::string>();
    }

    // Account, token, "owner", "market" or a hex literal
    Address resolve(const std::string& name) const {
        if (name == "owner") return config_.owner;
        if (name == "market") return market_.address();
        if (name.rfind("0x", 0) == 0) {
            try {
                return address_from_hex(name);
            } catch (const std::invalid_argument& e) {
                throw ScenarioError(e.what());
            }
        }
        auto it = names_.find(name);
        if (it == names_.end()) {
            throw ScenarioError("Unknown name: " + name);
        }
        return it->second;
    }

    Address address_field(const json& step, const char* field) const {
        return resolve(string_field(step, field));
    }

    Address address_or_zero(const json& step, const char* field) const {
        return step.contains(field) ? address_field(step, field) : ZERO_ADDRESS;
    }

    Currency currency_field(const json& step, const char* field) const {
        std::string name = string_field(step, field);
        return name == "native" ? NATIVE : Currency{resolve(name)};
    }

    SwapTarget swap_field(const json& step) const {
        SwapTarget target;
        if (!step.contains("desired")) return target;
        const json& desired = step.at("desired");
        target.token = address_field(desired, "token");
        target.token_id = u64_or(desired, "token_id", 0);
        target.erc1155_quantity = amount_or(desired, "quantity", 0);
        return target;
    }

    std::vector<Address> address_list(const json& step, const char* field) const {
        std::vector<Address> result;
        if (!step.contains(field)) return result;
        for (const auto& item : step.at(field)) {
            if (!item.is_string()) {
                throw ScenarioError(std::string("Field '") + field + "' must list names");
            }
            result.push_back(resolve(item.get<std::string>()));
        }
        return result;
    }

    //--------------------------------------------------------------------------
    // Deployment
    //--------------------------------------------------------------------------

    void deploy(const json& token) {
        std::string name = string_field(token, "name");
        std::string type = string_field(token, "type");
        if (names_.count(name)) {
            throw ScenarioError("Duplicate name: " + name);
        }
        Address addr = chain_.allocate_address();

        if (type == "erc20") {
            ReturnConvention convention = ReturnConvention::Standard;
            std::string conv = token.contains("convention") ? string_field(token, "convention")
                                                            : "standard";
            if (conv == "no_return_data") {
                convention = ReturnConvention::NoReturnData;
            } else if (conv == "false_on_failure") {
                convention = ReturnConvention::FalseOnFailure;
            } else if (conv != "standard") {
                throw ScenarioError("Unknown return convention: " + conv);
            }
            erc20_[name] = std::make_unique<Erc20Token>(chain_, addr, name, convention);
        } else if (type == "erc721" || type == "erc1155") {
            bool royalties = token.contains("royalty");
            if (type == "erc721") {
                erc721_[name] = std::make_unique<Erc721Collection>(chain_, addr, name, royalties);
            } else {
                erc1155_[name] = std::make_unique<Erc1155Collection>(chain_, addr, name, royalties);
            }
            if (royalties) {
                const json& royalty = token.at("royalty");
                Address receiver = address_field(royalty, "receiver");
                uint32_t bps = static_cast<uint32_t>(u64_or(royalty, "bps", 0));
                if (type == "erc721") {
                    erc721_[name]->set_default_royalty(receiver, bps);
                } else {
                    erc1155_[name]->set_default_royalty(receiver, bps);
                }
            }
        } else {
            throw ScenarioError("Unknown token type: " + type);
        }
        names_[name] = addr;

        if (level_ == LogLevel::Debug) {
            std::cerr << "deployed " << type << " " << name << " at " << to_hex(addr) << "\n";
        }
    }

    //--------------------------------------------------------------------------
    // Steps
    //--------------------------------------------------------------------------

    bool run_step(size_t index, const json& step) {
        std::string type = string_field(step, "type");
        std::string expected_error = step.contains("expect_error")
            ? string_field(step, "expect_error") : "";

        if (level_ == LogLevel::Debug) {
            std::cerr << "step " << index << ": " << step.dump() << "\n";
        }

        std::string failure;
        try {
            execute(type, step);
        } catch (const MarketError& e) {
            failure = std::string(error_name(e.code()));
            if (failure != expected_error) {
                std::cerr << "step " << index << " (" << type << ") failed: " << e.what() << "\n";
                return false;
            }
        } catch (const TokenError& e) {
            failure = "token_error";
            if (failure != expected_error) {
                std::cerr << "step " << index << " (" << type << ") reverted: " << e.what() << "\n";
                return false;
            }
        } catch (const ExecutionError& e) {
            failure = "execution_error";
            if (failure != expected_error) {
                std::cerr << "step " << index << " (" << type << ") aborted: " << e.what() << "\n";
                return false;
            }
        } catch (const ExpectationError& e) {
            std::cerr << "step " << index << " (" << type << "): " << e.what() << "\n";
            return false;
        }

        if (!expected_error.empty() && failure.empty()) {
            std::cerr << "step " << index << " (" << type << ") succeeded, expected "
                      << expected_error << "\n";
            return false;
        }
        return true;
    }

    void execute(const std::string& type, const json& step) {
        if (type == "mint") {
            mint(step);
        } else if (type == "approve") {
            approve(step);
        } else if (type == "set_approval_for_all") {
            set_approval_for_all(step);
        } else if (type == "allow_currency") {
            Currency currency = currency_field(step, "currency");
            admin(step, [&](const CallContext& ctx) { market_.add_currency(ctx, currency); });
        } else if (type == "remove_currency") {
            Currency currency = currency_field(step, "currency");
            admin(step, [&](const CallContext& ctx) { market_.remove_currency(ctx, currency); });
        } else if (type == "whitelist_collection") {
            Address collection = address_field(step, "collection");
            admin(step, [&](const CallContext& ctx) {
                market_.whitelist_collection(ctx, collection);
            });
        } else if (type == "set_fee_rate") {
            uint32_t rate = static_cast<uint32_t>(u64_or(step, "fee_rate", 0));
            admin(step, [&](const CallContext& ctx) { market_.set_fee_rate(ctx, rate); });
        } else if (type == "create") {
            create(step);
        } else if (type == "purchase") {
            purchase(step);
        } else if (type == "update") {
            update(step);
        } else if (type == "cancel") {
            uint64_t id = u64_or(step, "listing", 0);
            chain_.transact(address_field(step, "from"), market_.address(), 0,
                            [&](const CallContext& ctx) { market_.cancel_listing(ctx, id); });
        } else if (type == "clean") {
            uint64_t id = u64_or(step, "listing", 0);
            chain_.transact(address_field(step, "from"), market_.address(), 0,
                            [&](const CallContext& ctx) { market_.clean_listing(ctx, id); });
        } else if (type == "expect_balance") {
            expect_balance(step);
        } else {
            throw ScenarioError("Unknown step type: " + type);
        }
    }

    template<typename Fn>
    void admin(const json& step, Fn&& fn) {
        Address from = step.contains("from") ? address_field(step, "from") : config_.owner;
        chain_.transact(from, market_.address(), 0, std::forward<Fn>(fn));
    }

    void mint(const json& step) {
        std::string token = string_field(step, "token");
        Address to = address_field(step, "to");

        if (auto it = erc20_.find(token); it != erc20_.end()) {
            Amount amount = amount_or(step, "amount", 0);
            chain_.transact(to, it->second->address(), 0,
                            [&](const CallContext&) { it->second->mint(to, amount); });
        } else if (auto it = erc721_.find(token); it != erc721_.end()) {
            TokenId id = u64_or(step, "token_id", 0);
            chain_.transact(to, it->second->address(), 0,
                            [&](const CallContext&) { it->second->mint(to, id); });
        } else if (auto it = erc1155_.find(token); it != erc1155_.end()) {
            TokenId id = u64_or(step, "token_id", 0);
            Amount amount = amount_or(step, "amount", 0);
            chain_.transact(to, it->second->address(), 0,
                            [&](const CallContext&) { it->second->mint(to, id, amount); });
        } else {
            throw ScenarioError("Unknown token: " + token);
        }
    }

    void approve(const json& step) {
        std::string token = string_field(step, "token");
        Address from = address_field(step, "from");
        Address spender = address_field(step, "spender");

        if (auto it = erc20_.find(token); it != erc20_.end()) {
            Amount amount = amount_or(step, "amount", 0);
            chain_.transact(from, it->second->address(), 0, [&](const CallContext& ctx) {
                it->second->approve(ctx.sender, spender, amount);
            });
        } else if (auto it = erc721_.find(token); it != erc721_.end()) {
            TokenId id = u64_or(step, "token_id", 0);
            chain_.transact(from, it->second->address(), 0, [&](const CallContext& ctx) {
                it->second->approve(ctx.sender, spender, id);
            });
        } else {
            throw ScenarioError("approve needs an erc20 or erc721 token: " + token);
        }
    }

    void set_approval_for_all(const json& step) {
        std::string token = string_field(step, "token");
        Address from = address_field(step, "from");
        Address op = address_field(step, "operator");
        bool approved = bool_or(step, "approved", true);

        if (auto it = erc721_.find(token); it != erc721_.end()) {
            chain_.transact(from, it->second->address(), 0, [&](const CallContext& ctx) {
                it->second->set_approval_for_all(ctx.sender, op, approved);
            });
        } else if (auto it = erc1155_.find(token); it != erc1155_.end()) {
            chain_.transact(from, it->second->address(), 0, [&](const CallContext& ctx) {
                it->second->set_approval_for_all(ctx.sender, op, approved);
            });
        } else {
            throw ScenarioError("set_approval_for_all needs an NFT collection: " + token);
        }
    }

    void create(const json& step) {
        CreateListingParams params;
        params.token_address = address_field(step, "token");
        params.token_id = u64_or(step, "token_id", 0);
        params.erc1155_holder = address_or_zero(step, "holder");
        params.price = amount_or(step, "price", 0);
        params.currency = step.contains("currency") ? currency_field(step, "currency") : NATIVE;
        params.desired = swap_field(step);
        params.erc1155_quantity = amount_or(step, "quantity", 0);
        params.buyer_whitelist_enabled = bool_or(step, "buyer_whitelist", false);
        params.partial_buy_enabled = bool_or(step, "partial_buy", false);
        params.allowed_buyers = address_list(step, "allowed_buyers");

        uint64_t id = chain_.transact(address_field(step, "from"), market_.address(), 0,
            [&](const CallContext& ctx) { return market_.create_listing(ctx, params); });

        if (level_ == LogLevel::Debug) {
            std::cerr << "created listing " << id << "\n";
        }
    }

    void purchase(const json& step) {
        PurchaseParams params;
        params.listing_id = u64_or(step, "listing", 0);
        params.erc1155_purchase_quantity = amount_or(step, "quantity", 0);
        params.desired_erc1155_holder = address_or_zero(step, "holder");

        // Omitted expectations default to the terms currently stored
        if (auto current = market_.find_listing(params.listing_id)) {
            params.expected = ExpectedTerms::of(*current);
        }
        if (step.contains("expected")) {
            const json& expected = step.at("expected");
            params.expected.price = amount_or(expected, "price", params.expected.price);
            if (expected.contains("currency")) {
                params.expected.currency = currency_field(expected, "currency");
            }
            params.expected.erc1155_quantity =
                amount_or(expected, "quantity", params.expected.erc1155_quantity);
            if (expected.contains("desired")) {
                params.expected.desired = swap_field(expected);
            }
        }

        Amount value = amount_or(step, "value", 0);
        chain_.transact(address_field(step, "from"), market_.address(), value,
                        [&](const CallContext& ctx) { market_.purchase_listing(ctx, params); });
    }

    void update(const json& step) {
        UpdateListingParams params;
        params.listing_id = u64_or(step, "listing", 0);

        // Omitted fields keep the stored value
        std::optional<Listing> current = market_.find_listing(params.listing_id);
        if (current) {
            params.price = current->price;
            params.currency = current->currency;
            params.desired = current->desired;
            params.erc1155_quantity = current->asset.wire_quantity();
            params.buyer_whitelist_enabled = current->buyer_whitelist_enabled;
            params.partial_buy_enabled = current->partial_buy_enabled;
        }
        params.price = amount_or(step, "price", params.price);
        if (step.contains("currency")) params.currency = currency_field(step, "currency");
        if (step.contains("desired")) params.desired = swap_field(step);
        params.erc1155_quantity = amount_or(step, "quantity", params.erc1155_quantity);
        params.buyer_whitelist_enabled =
            bool_or(step, "buyer_whitelist", params.buyer_whitelist_enabled);
        params.partial_buy_enabled = bool_or(step, "partial_buy", params.partial_buy_enabled);
        params.allowed_buyers = address_list(step, "allowed_buyers");

        chain_.transact(address_field(step, "from"), market_.address(), 0,
                        [&](const CallContext& ctx) { market_.update_listing(ctx, params); });
    }

    void expect_balance(const json& step) {
        Address account = address_field(step, "account");
        Amount expected = amount_or(step, "amount", 0);
        std::string currency = step.contains("currency") ? string_field(step, "currency")
                                                         : "native";
        Amount actual = 0;

        if (currency == "native") {
            actual = chain_.balance_of(account);
        } else if (auto it = erc20_.find(currency); it != erc20_.end()) {
            actual = it->second->balance_of(account);
        } else if (auto it = erc721_.find(currency); it != erc721_.end()) {
            actual = it->second->balance_of(account);
        } else if (auto it = erc1155_.find(currency); it != erc1155_.end()) {
            actual = it->second->balance_of(account, u64_or(step, "token_id", 0));
        } else {
            throw ScenarioError("Unknown currency: " + currency);
        }

        if (actual != expected) {
            throw ExpectationError("balance of " + string_field(step, "account") + " in " + currency +
                                " is " + amount_to_string(actual) + ", expected " +
                                amount_to_string(expected));
        }
    }
};

//------------------------------------------------------------------------------
// Entry point
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "nftmart scenario runner " << version() << "\n\n"
              << "Usage: " << prog << " [options] <config.json> <scenario.json>\n\n"
              << "Options:\n"
              << "  -v, --verbose        Debug output on stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Exit status: 0 all steps passed, 1 a step failed, 2 usage or config error\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(2);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        std::exit(2);
    }
    options.config_path = positional[0];
    options.scenario_path = positional[1];
    return options;
}

json read_json_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ScenarioError("Cannot open scenario file: " + path);
    }
    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        throw ScenarioError("Scenario is not valid JSON: " + path);
    }
    return doc;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    MarketConfig config;
    json scenario_doc;
    try {
        config = MarketConfig::from_file(options.config_path);
        scenario_doc = read_json_file(options.scenario_path);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const ScenarioError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    LogLevel level = options.verbose ? LogLevel::Debug : config.log_level;

    try {
        Scenario scenario(config, level);
        scenario.load(scenario_doc);

        int failures = scenario.run();
        if (failures > 0) {
            std::cerr << failures << " step(s) failed\n";
            return 1;
        }
    } catch (const ScenarioError& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
        return 2;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const MarketError& e) {
        std::cerr << "Deployment failed: " << e.what() << "\n";
        return 2;
    }

    if (level != LogLevel::Quiet) {
        std::cerr << "all steps passed\n";
    }
    return 0;
}
