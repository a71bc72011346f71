#include "auth/AuthManager.hpp"
#include "config/ConfigRegistry.hpp"
#include "crypto/PasswordHash.hpp"
#include "db/DBPool.hpp"
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/query/UserQueries.hpp"
#include "log/Registry.hpp"
#include "types/User.hpp"

#include <iostream>
#include <string>

using namespace mv::config;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " check-users\n"
              << "  " << prog << " reset-password <email> <new_password>\n"
              << "  " << prog << " hash-password <password>\n";
}

std::shared_ptr<mv::auth::AuthManager> connect() {
    const auto& cfg = ConfigRegistry::get();
    auto pool = std::make_shared<mv::db::DBPool>(cfg.database);
    auto txns = std::make_shared<mv::db::Transactions>(pool);
    mv::db::initTables(*txns, cfg.database);
    pool->initPreparedStatements();
    return std::make_shared<mv::auth::AuthManager>(std::make_shared<mv::db::query::UserQueries>(txns), cfg.auth);
}

int checkUsers() {
    const auto broken = connect()->auditPasswordHashes();
    if (broken.empty()) {
        std::cout << "All stored password hashes are valid Argon2 encodings." << std::endl;
        return 0;
    }

    std::cout << broken.size() << " user(s) with unusable password hashes:" << std::endl;
    for (const auto& u : broken) std::cout << "  " << u->email << " (" << u->id << ")" << std::endl;
    std::cout << "Repair with: reset-password <email> <new_password>" << std::endl;
    return 2;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    const std::string cmd = argv[1];

    try {
        ConfigRegistry::init(ConfigRegistry::configPathFromEnv());
        mv::log::Registry::init();

        if (cmd == "check-users" && argc == 2) return checkUsers();

        if (cmd == "reset-password" && argc == 4) {
            connect()->resetPassword(argv[2], argv[3]);
            std::cout << "Password reset for " << argv[2] << std::endl;
            return 0;
        }

        if (cmd == "hash-password" && argc == 3) {
            const auto& auth = ConfigRegistry::get().auth;
            std::cout << mv::crypto::hashPassword(argv[2], {auth.pwhash_ops_limit, auth.pwhash_mem_limit}) << std::endl;
            return 0;
        }

        usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 3;
    }
}
