/*
 * table.hpp
 *
 * Column-aligned text tables for benchmark reports.
 */

#ifndef TABLE_HPP_
#define TABLE_HPP_

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace table {

/*
 * Given a printf-style format and args, return the formatted string as a std::string.
 *
 * See https://stackoverflow.com/a/26221725/149138.
 */
template<typename ... Args>
std::string string_format(const std::string& format, Args ... args) {
    size_t size = snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
    std::unique_ptr<char[]> buf( new char[ size ] );
    snprintf( buf.get(), size, format.c_str(), args ... );
    return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

class Table;

struct ColInfo {
    enum Justification { LEFT, RIGHT } justify;
    ColInfo() : justify(LEFT) {}
};

class Row {
    friend Table;

    const Table* table_;
    std::vector<std::string> cells_;

    explicit Row(const Table& table) : table_(&table) {}

    inline void write(std::ostream& os, const std::vector<size_t>& widths) const;

public:
    /** append a cell holding elem as written by operator<<, returns this row */
    template <typename T>
    Row& add(const T& elem) {
        std::stringstream ss;
        ss << elem;
        cells_.push_back(ss.str());
        return *this;
    }

    /** append a cell formatted printf-style, returns this row */
    template <typename ... Args>
    Row& addf(const char* format, Args ... args) {
        cells_.push_back(string_format(format, args...));
        return *this;
    }

    size_t size() const {
        return cells_.size();
    }
};

class Table {
    friend Row;

    std::vector<Row> rows_;
    std::vector<ColInfo> colinfo_;
    std::string sep_;

public:

    Table() : sep_(" ") {}

    /** the ColInfo for column col, created on first use */
    ColInfo& colInfo(size_t col) {
        if (col >= colinfo_.size()) {
            colinfo_.resize(col + 1);
        }
        return colinfo_.at(col);
    }

    ColInfo colInfo(size_t col) const {
        return col < colinfo_.size() ? colinfo_.at(col) : ColInfo{};
    }

    Row& newRow() {
        rows_.push_back(Row{*this});
        return rows_.back();
    }

    /**
     * Add a header row from the given titles, and set the justification of each
     * of those columns.
     */
    Row& newHeader(const std::vector<std::pair<std::string, ColInfo::Justification>>& titles) {
        Row& header = newRow();
        for (const auto& t : titles) {
            header.add(t.first);
            colInfo(header.size() - 1).justify = t.second;
        }
        return header;
    }

    void setColumnSeparator(std::string s) {
        sep_ = s;
    }

    /** render the table, one line per row, each column as wide as its widest cell */
    std::string str() const {
        std::vector<size_t> widths;
        for (const auto& r : rows_) {
            for (size_t c = 0; c < r.cells_.size(); c++) {
                if (c >= widths.size()) {
                    widths.push_back(0);
                }
                widths[c] = std::max(widths[c], r.cells_[c].size());
            }
        }

        std::stringstream ss;
        for (const auto& r : rows_) {
            r.write(ss, widths);
            ss << "\n";
        }
        return ss.str();
    }
};

inline void Row::write(std::ostream& os, const std::vector<size_t>& widths) const {
    for (size_t c = 0; c < cells_.size(); c++) {
        assert(c < widths.size());
        if (c) os << table_->sep_;
        bool left = table_->colInfo(c).justify == ColInfo::LEFT;
        os << std::setw(widths[c]) << (left ? std::left : std::right) << cells_[c];
    }
}

}

#endif /* TABLE_HPP_ */
