#pragma once
/// @file TypedRepository.hpp
/// @brief Statically typed view over a JSON collection repository

#include "../record/RecordBase.hpp"
#include "JsonFileRepository.hpp"

#include <memory>
#include <type_traits>
#include <vector>

namespace DocStore {

/// @brief Typed record adapter (template)
/// @tparam T Record type derived from RecordBase
/// @details Stored records are decoded by cloning a prototype and calling
///          fromJson on the clone. Records that fail to decode are skipped
///          by findAll and reported through `ec` by the single-record calls.
template <typename T> class TypedRepository {
    static_assert(std::is_base_of<RecordBase, T>::value, "T must derive from RecordBase");

  public:
    /// @param repo Underlying JSON repository
    /// @param prototype Decoding prototype (carries entity-specific state such as the entity name)
    TypedRepository(std::shared_ptr<JsonFileRepository> repo, T prototype)
        : repo_(std::move(repo)), prototype_(std::move(prototype)) {}

    /// @brief Store a new record
    /// @return Stored record with id and timestamps, nullptr on failure
    std::unique_ptr<T> create(const T& record, std::vector<FieldViolation>* violations, std::error_code& ec) {
        Json::Value j;
        record.toJson(j);
        auto stored = repo_->create(j, violations, ec);
        if (!stored)
            return nullptr;
        return decode(*stored, ec);
    }

    std::unique_ptr<T> create(const T& record, std::error_code& ec) { return create(record, nullptr, ec); }

    /// @brief Merge the record's fields over the stored record with the same id
    /// @return Updated record, nullptr when not found (ec cleared) or on failure
    std::unique_ptr<T> update(const T& record, std::error_code& ec) {
        Json::Value j;
        record.toJson(j);
        auto stored = repo_->update(record.id(), j, nullptr, ec);
        if (!stored)
            return nullptr;
        return decode(*stored, ec);
    }

    /// @brief Find record by ID
    std::unique_ptr<T> findById(long long id, std::error_code& ec) {
        auto found = repo_->findById(id, ec);
        if (!found)
            return nullptr;
        return decode(*found, ec);
    }

    /// @brief Find all decodable records
    std::vector<std::unique_ptr<T>> findAll(std::error_code& ec) {
        std::vector<std::unique_ptr<T>> result;
        auto all = repo_->findAll(ec);
        if (ec)
            return result;
        for (const auto& j : all) {
            std::error_code dec;
            auto rec = decode(j, dec);
            // 디코딩 실패 레코드는 건너뛰고 나머지는 계속 반환한다.
            if (rec)
                result.push_back(std::move(rec));
        }
        return result;
    }

    bool deleteById(long long id, std::error_code& ec) { return repo_->deleteById(id, ec); }

    JsonFileRepository& raw() noexcept { return *repo_; }

  private:
    std::unique_ptr<T> decode(const Json::Value& j, std::error_code& ec) const {
        // clone 결과를 T로 downcast 가능한 경우에만 소유권을 넘긴다.
        auto cloned = prototype_.clone();
        auto* typed = dynamic_cast<T*>(cloned.get());
        if (typed == nullptr) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return nullptr;
        }
        (void)cloned.release();
        std::unique_ptr<T> out(typed);
        if (!out->fromJson(j, ec))
            return nullptr;
        return out;
    }

    std::shared_ptr<JsonFileRepository> repo_;
    T prototype_;
};

} // namespace DocStore
