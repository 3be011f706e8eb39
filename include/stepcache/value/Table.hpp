#pragma once

#include <stepcache/value/Value.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Именованная колонка таблицы
 */
struct Column {
    std::string name;
    std::vector<Value> cells;
};

/**
 * @brief Таблица: упорядоченные именованные колонки одинаковой длины
 *
 * Ячейки - произвольные Value: скаляры, bytes, NdArray и т.д.
 * Что из этого можно записать на диск, решают ParquetTable и TableSerializer.
 *
 * Пример:
 * @code
 *   Table table{{"a", {1, 2, 3}}, {"b", {4, 5, 6}}};
 *   table.rows();  // 3
 * @endcode
 */
class Table {
public:
    Table() = default;

    Table(std::initializer_list<std::pair<std::string, std::vector<Value>>> columns) {
        for (const auto& [name, cells] : columns) {
            addColumn(name, cells);
        }
    }

    /**
     * @brief Добавить колонку в конец
     * @throws std::invalid_argument при повторном имени или несовпадении длины
     */
    void addColumn(std::string name, std::vector<Value> cells) {
        if (hasColumn(name)) {
            throw std::invalid_argument("Duplicate column name: " + name);
        }
        if (!columns_.empty() && cells.size() != rows_) {
            throw std::invalid_argument(
                "Column '" + name + "' has " + std::to_string(cells.size()) +
                " rows, table has " + std::to_string(rows_));
        }
        rows_ = cells.size();
        columns_.push_back(Column{std::move(name), std::move(cells)});
    }

    size_t rows() const { return rows_; }
    size_t columnCount() const { return columns_.size(); }

    bool hasColumn(const std::string& name) const {
        return find(name) != nullptr;
    }

    /**
     * @brief Ячейки колонки по имени
     * @throws std::out_of_range если колонки нет
     */
    const std::vector<Value>& column(const std::string& name) const {
        const Column* found = find(name);
        if (found == nullptr) {
            throw std::out_of_range("No such column: " + name);
        }
        return found->cells;
    }

    std::vector<Value>& column(const std::string& name) {
        return const_cast<std::vector<Value>&>(
            static_cast<const Table&>(*this).column(name));
    }

    const std::vector<Column>& columns() const { return columns_; }

    std::vector<std::string> columnNames() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto& column : columns_) {
            names.push_back(column.name);
        }
        return names;
    }

    bool operator==(const Table& other) const {
        if (rows_ != other.rows_ || columns_.size() != other.columns_.size()) {
            return false;
        }
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].name != other.columns_[i].name ||
                columns_[i].cells != other.columns_[i].cells) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const Table& other) const {
        return !(*this == other);
    }

private:
    const Column* find(const std::string& name) const {
        for (const auto& column : columns_) {
            if (column.name == name) {
                return &column;
            }
        }
        return nullptr;
    }

    std::vector<Column> columns_;
    size_t rows_ = 0;
};
