#pragma once

#include "db/UserStore.hpp"
#include "types/User.hpp"

#include <map>
#include <mutex>

namespace mv::test {

class MemoryUserStore final : public db::UserStore {
public:
    db::CreateResult<types::User> create(const types::User& user) override {
        std::scoped_lock lock(mtx_);
        for (const auto& [id, u] : users_)
            if (id == user.id || u.email == user.email) return db::CreateResult<types::User>::AlreadyExists();
        users_[user.id] = user;
        return db::CreateResult<types::User>::Created(std::make_shared<types::User>(user));
    }

    UserPtr getById(const std::string& id) override {
        std::scoped_lock lock(mtx_);
        const auto it = users_.find(id);
        return it == users_.end() ? nullptr : std::make_shared<types::User>(it->second);
    }

    UserPtr getByEmail(const std::string& email) override {
        std::scoped_lock lock(mtx_);
        for (const auto& [_, u] : users_)
            if (u.email == email) return std::make_shared<types::User>(u);
        return nullptr;
    }

    bool updatePasswordHash(const std::string& id, const std::string& passwordHash) override {
        std::scoped_lock lock(mtx_);
        const auto it = users_.find(id);
        if (it == users_.end()) return false;
        it->second.password_hash = passwordHash;
        return true;
    }

    std::vector<UserPtr> list() override {
        std::scoped_lock lock(mtx_);
        std::vector<UserPtr> out;
        for (const auto& [_, u] : users_) out.push_back(std::make_shared<types::User>(u));
        return out;
    }

    // Bypasses validation, for seeding broken rows
    void put(const types::User& user) {
        std::scoped_lock lock(mtx_);
        users_[user.id] = user;
    }

    size_t size() const {
        std::scoped_lock lock(mtx_);
        return users_.size();
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, types::User> users_;
};

}
