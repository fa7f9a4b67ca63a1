#include "tcd_table.h"

#include <algorithm>
#include <iomanip>

// --------------------------------------------------------------------------
void tcd_table::declare_columns(const std::vector<std::string> &names)
{
    this->columns = names;
    this->rows.clear();
}

// --------------------------------------------------------------------------
std::string tcd_table::get(unsigned long i, const std::string &column) const
{
    auto it = std::find(this->columns.begin(), this->columns.end(), column);
    if ((it == this->columns.end()) || (i >= this->rows.size()))
        return std::string();
    return this->rows[i][it - this->columns.begin()];
}

// --------------------------------------------------------------------------
void tcd_table::to_stream(std::ostream &os) const
{
    unsigned int n_cols = this->columns.size();

    std::vector<size_t> width(n_cols);
    for (unsigned int j = 0; j < n_cols; ++j)
    {
        width[j] = this->columns[j].size();
        for (const auto &row : this->rows)
            width[j] = std::max(width[j], row[j].size());
    }

    if (!this->title.empty())
        os << this->title << std::endl;

    for (unsigned int j = 0; j < n_cols; ++j)
        os << (j ? " | " : "") << std::left << std::setw(width[j]) << this->columns[j];
    os << std::endl;

    for (unsigned int j = 0; j < n_cols; ++j)
        os << (j ? "-+-" : "") << std::string(width[j], '-');
    os << std::endl;

    for (const auto &row : this->rows)
    {
        for (unsigned int j = 0; j < n_cols; ++j)
            os << (j ? " | " : "") << std::left << std::setw(width[j]) << row[j];
        os << std::endl;
    }

    os << std::right;
}
