#ifndef tcd_table_h
#define tcd_table_h

/// @file

#include "tcd_config.h"

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

/** @brief
 * A small row oriented table of text cells used for the human readable
 * reports produced by the pipeline, such as the schema validation table and
 * the per wavenumber summary.
 *
 * @details
 * Columns are declared once, then rows are appended with one value per
 * column. Values are formatted with operator<< as they are appended.
 */
class TCD_EXPORT tcd_table
{
public:
    tcd_table() = default;

    /// set the title printed above the table
    void set_title(const std::string &title) { this->title = title; }
    const std::string &get_title() const { return this->title; }

    /// declare the columns. clears any existing rows.
    void declare_columns(const std::vector<std::string> &names);

    unsigned int get_number_of_columns() const { return this->columns.size(); }
    unsigned long get_number_of_rows() const { return this->rows.size(); }

    const std::vector<std::string> &get_column_names() const
    { return this->columns; }

    /// append a row, one value per column
    template <typename... args_t>
    int append(args_t &&... args);

    /// get the cell in row i, column j
    const std::string &get(unsigned long i, unsigned int j) const
    { return this->rows[i][j]; }

    /** get the cell in row i of the named column. returns an empty string if
     * there is no such column.
     */
    std::string get(unsigned long i, const std::string &column) const;

    bool empty() const { return this->rows.empty(); }

    void clear() { this->rows.clear(); }

    /// send to the stream as an aligned text table
    void to_stream(std::ostream &os) const;

private:
    template <typename val_t, typename... args_t>
    void format(std::vector<std::string> &row, val_t &&val, args_t &&... args)
    {
        std::ostringstream oss;
        oss.precision(8);
        oss << val;
        row.push_back(oss.str());
        this->format(row, std::forward<args_t>(args)...);
    }

    void format(std::vector<std::string> &) {}

private:
    std::string title;
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
};

// --------------------------------------------------------------------------
template <typename... args_t>
int tcd_table::append(args_t &&... args)
{
    if (sizeof...(args) != this->columns.size())
        return -1;

    std::vector<std::string> row;
    row.reserve(this->columns.size());
    this->format(row, std::forward<args_t>(args)...);
    this->rows.push_back(std::move(row));

    return 0;
}

inline
std::ostream &operator<<(std::ostream &os, const tcd_table &table)
{
    table.to_stream(os);
    return os;
}

#endif
