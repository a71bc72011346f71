#pragma once

#include <memory>
#include <utility>

namespace mv::db {

enum class CreateStatus { Created, AlreadyExists };

template <typename T>
struct CreateResult {
    CreateStatus status{CreateStatus::Created};
    std::shared_ptr<T> record{};  // set when Created

    [[nodiscard]] bool created() const { return status == CreateStatus::Created; }

    static CreateResult Created(std::shared_ptr<T> rec) { return {CreateStatus::Created, std::move(rec)}; }
    static CreateResult AlreadyExists() { return {CreateStatus::AlreadyExists, nullptr}; }
};

}
