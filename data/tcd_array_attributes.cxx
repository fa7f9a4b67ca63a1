#include "tcd_array_attributes.h"

// --------------------------------------------------------------------------
void tcd_array_attributes::to_stream(std::ostream &os) const
{
    os << "units = \"" << this->units << "\", long_name = \""
        << this->long_name << "\", description = \"" << this->description
        << "\"";

    if (this->have_fill_value)
        os << ", fill_value = " << this->fill_value;
}
