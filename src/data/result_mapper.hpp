#pragma once

#include "query_executor.hpp"
#include "record_traits.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlgraph::data {

// Order-sensitive key of a column-name sequence: seed 17, then
// key = key * 31 + hash(name) for each name, wrapping on overflow
std::size_t compute_column_key(const std::vector<std::string>& columns);

// Lower-cased name with the separators '_', '-' and ' ' removed
std::string normalize_column_name(std::string_view name);

template<typename T>
struct ColumnBinding {
    std::size_t ordinal;
    const char* field_name;
    std::function<void(T&, const SqlValue&)> setter;
};

// Bindings for one (T, column-name sequence) pair. Immutable once cached.
template<typename T>
struct FieldBindingSet {
    std::vector<std::string> columns;
    std::vector<ColumnBinding<T>> bindings;
};

/**
 * @brief Binds the rows of a ResultCursor to new instances of T
 *
 * T must be default constructible and have a RecordTraits specialization.
 * Columns are matched to fields by normalized name; columns without a
 * matching field are ignored.
 */
template<typename T>
class ResultMapper {
    static_assert(has_record_traits_v<T>, "mapped type needs a RecordTraits specialization");

public:
    using BindingSetPtr = std::shared_ptr<const FieldBindingSet<T>>;
    using RowAction = std::function<void(T)>;

    explicit ResultMapper(ResultCursor& cursor)
        : cursor_(cursor), bindings_(bindings_for(cursor.field_names())) {}

    // Reads every remaining row
    void map(const RowAction& action) {
        while (cursor_.read()) {
            action(map_current_row());
        }
    }

    // Materializes the row the cursor is positioned on
    T map_current_row() const {
        return materialize(*bindings_, cursor_);
    }

    const FieldBindingSet<T>& bindings() const noexcept { return *bindings_; }

    // Poll-driven reader step for QueryExecutor::execute_async. Yields after
    // every row so cancellation is observed between fetches.
    static AsyncReaderCallback map_async(RowAction action) {
        auto bindings = std::make_shared<BindingSetPtr>();
        return [bindings, action = std::move(action)](ResultCursor& cursor) {
            if (!*bindings) {
                *bindings = bindings_for(cursor.field_names());
            }
            bool has_row = false;
            if (PollStatus status = cursor.read_async(has_row); status != PollStatus::Ready) {
                return status;
            }
            if (!has_row) {
                return PollStatus::Ready;
            }
            action(materialize(**bindings, cursor));
            return PollStatus::Yielded;
        };
    }

    // Row factory for QueryExecutor::execute_stream
    static RowsFrom<T> rows() {
        return [](ResultCursor& cursor) -> RowMaterializer<T> {
            BindingSetPtr bindings = bindings_for(cursor.field_names());
            return [bindings](ResultCursor& current) { return materialize(*bindings, current); };
        };
    }

    static BindingSetPtr bindings_for(const std::vector<std::string>& columns) {
        return bindings_for(columns, compute_column_key(columns));
    }

    // Lookup under an explicit key. An entry stored under the same key for
    // a different column sequence is not reused.
    static BindingSetPtr bindings_for(const std::vector<std::string>& columns, std::size_t key) {
        Cache& cache = instance();
        {
            std::lock_guard<std::mutex> lock(cache.mutex);
            if (BindingSetPtr hit = cache.lookup(key, columns)) {
                return hit;
            }
        }

        BindingSetPtr built = build(columns);

        std::lock_guard<std::mutex> lock(cache.mutex);
        if (BindingSetPtr raced = cache.lookup(key, columns)) {
            return raced;
        }
        cache.entries[key].push_back(built);
        return built;
    }

    static std::size_t cached_sets() {
        Cache& cache = instance();
        std::lock_guard<std::mutex> lock(cache.mutex);
        std::size_t count = 0;
        for (const auto& [key, sets] : cache.entries) {
            count += sets.size();
        }
        return count;
    }

private:
    struct Cache {
        std::mutex mutex;
        std::unordered_map<std::size_t, std::vector<BindingSetPtr>> entries;

        BindingSetPtr lookup(std::size_t key, const std::vector<std::string>& columns) const {
            auto it = entries.find(key);
            if (it == entries.end()) {
                return nullptr;
            }
            for (const auto& set : it->second) {
                if (set->columns == columns) {
                    return set;
                }
            }
            return nullptr;
        }
    };

    static Cache& instance() {
        static Cache cache;
        return cache;
    }

    static BindingSetPtr build(const std::vector<std::string>& columns) {
        auto set = std::make_shared<FieldBindingSet<T>>();
        set->columns = columns;
        for (std::size_t i = 0; i < columns.size(); ++i) {
            std::string column = normalize_column_name(columns[i]);
            bool matched = false;
            for_each_field<T>([&](const auto& f) {
                if (matched || normalize_column_name(f.name) != column) {
                    return;
                }
                matched = true;
                auto member = f.member;
                set->bindings.push_back(ColumnBinding<T>{
                    i, f.name,
                    [member](T& row, const SqlValue& value) { assign_member(row.*member, value); }});
            });
        }
        return set;
    }

    static T materialize(const FieldBindingSet<T>& set, ResultCursor& cursor) {
        T row{};
        for (const auto& binding : set.bindings) {
            SqlValue value = cursor.is_null(binding.ordinal) ? SqlValue{}
                                                            : cursor.get_value(binding.ordinal);
            binding.setter(row, value);
        }
        return row;
    }

    ResultCursor& cursor_;
    BindingSetPtr bindings_;
};

} // namespace sqlgraph::data
