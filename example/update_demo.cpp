// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file update_demo.cpp
/// @brief Demonstrates docupdate::as_update
///
/// This example shows:
/// - Registering records with RecordTraits
/// - omitempty fields moving between $set and $unset
/// - Inline records and inline maps
/// - Custom representation through get_document()
/// - Updates from mappings and raw documents
/// - Error reporting

#include <docupdate/errors.h>
#include <docupdate/serialization.h>
#include <docupdate/update.h>

#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>

using namespace docupdate;

// ============================================================================
// Record Types
// ============================================================================

struct Audit {
    std::chrono::system_clock::time_point modified;
    std::string modified_by;
};

struct Account {
    std::string id;
    std::string owner;
    int64_t balance = 0;
    std::optional<std::string> nickname;
    Audit audit;
    std::map<std::string, Value> extra;
};

/// Stored as an ISO currency code rather than as a record
struct Currency {
    int numeric = 0;
};

Boxed get_document(const Currency* self) {
    if (self == nullptr) {
        return Boxed{};
    }
    switch (self->numeric) {
        case 978: return Boxed::of(std::string("EUR"));
        case 840: return Boxed::of(std::string("USD"));
        default: return Boxed::of(std::to_string(self->numeric));
    }
}

struct Transfer {
    std::string id;
    Currency currency;
    double amount = 0;
};

namespace docupdate {

template <>
struct RecordTraits<Audit> {
    static constexpr std::string_view name = "Audit";
    static std::vector<FieldInfo> fields() {
        return {
            field<&Audit::modified>("Modified", ",omitempty"),
            field<&Audit::modified_by>("ModifiedBy", "modified_by,omitempty"),
        };
    }
};

template <>
struct RecordTraits<Account> {
    static constexpr std::string_view name = "Account";
    static std::vector<FieldInfo> fields() {
        return {
            field<&Account::id>("Id", "_id"),
            field<&Account::owner>("Owner"),
            field<&Account::balance>("Balance", ",omitempty"),
            field<&Account::nickname>("Nickname", ",omitempty"),
            field<&Account::audit>("Audit", ",inline"),
            field<&Account::extra>("Extra", ",inline"),
        };
    }
};

template <>
struct RecordTraits<Transfer> {
    static constexpr std::string_view name = "Transfer";
    static std::vector<FieldInfo> fields() {
        return {
            field<&Transfer::id>("Id", "_id"),
            field<&Transfer::currency>("Currency"),
            field<&Transfer::amount>("Amount"),
        };
    }
};

} // namespace docupdate

// ============================================================================
// Helpers
// ============================================================================

void print_update(const Update& u) {
    std::cout << "$set:\n";
    print_value(Value{u.set}, "  ");
    std::cout << "$unset:\n";
    print_value(Value{u.unset}, "  ");
}

// ============================================================================
// Demos
// ============================================================================

void demo_records() {
    std::cout << "=== Records ===\n\n";

    Account account;
    account.id = "acct-1";
    account.owner = "ann";
    account.extra["tier"] = Value{"gold"};

    std::cout << "--- Fresh account ---\n";
    print_update(as_update(account));

    std::cout << "\n--- After a deposit ---\n";
    account.balance = 2500;
    account.nickname = "savings";
    account.audit.modified = std::chrono::system_clock::now();
    account.audit.modified_by = "teller-7";
    print_update(as_update(&account));
}

void demo_representation() {
    std::cout << "\n=== Custom Representation ===\n\n";

    Transfer transfer{"tx-9", Currency{978}, 12.5};
    print_update(as_update(transfer));
}

void demo_mappings() {
    std::cout << "\n=== Mappings and Raw Documents ===\n\n";

    std::map<std::string, int> counters{{"_id", 1}, {"views", 12}, {"likes", 3}};
    std::cout << "--- std::map ---\n";
    print_update(as_update(counters));

    ByteBuffer bytes = serialize(Value::map({{"status", "closed"}, {"_id", "acct-1"}}));
    RawValue raw{bytes[0], ByteBuffer(bytes.begin() + 1, bytes.end())};
    std::cout << "\n--- Raw document ---\n";
    print_update(as_update(raw));

    std::cout << "\n--- Update operator document ---\n";
    print_value(as_update(counters).to_value());
}

void demo_errors() {
    std::cout << "\n=== Errors ===\n\n";

    try {
        (void)as_update(42);
    } catch (const MarshalError& e) {
        std::cout << "[MarshalError] " << e.what() << "\n";
    }

    try {
        (void)as_update(std::map<int, std::string>{{1, "one"}});
    } catch (const ShapeError& e) {
        std::cout << "[ShapeError] " << e.what() << "\n";
    }

    Account account;
    account.extra["owner"] = Value{"mallory"};
    try {
        (void)as_update(account);
    } catch (const ConflictError& e) {
        std::cout << "[ConflictError] " << e.what() << "\n";
    }
}

int main() {
    demo_records();
    demo_representation();
    demo_mappings();
    demo_errors();
    return 0;
}
