#include "tcd_variable_spec.h"
#include "tcd_schema.h"
#include "tcd_yaml_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

// --------------------------------------------------------------------------
int tcd_variable_spec::from_record(const std::string &key,
    const tcd_config_record &rec, tcd_variable_spec &spec)
{
    spec = tcd_variable_spec();
    spec.key = key;

    bool derived = false;
    bool flip_lat = false;
    bool flip_z = false;
    bool squeeze = false;

    if (rec.get("units", spec.units) ||
        rec.get("name", spec.name) ||
        rec.get("description", spec.description) ||
        rec.get("ncfile", spec.ncfile) ||
        rec.get("ncvarname", spec.ncvarname) ||
        rec.get("flip_lat", flip_lat) ||
        rec.get("flip_z", flip_z) ||
        rec.get("squeeze", squeeze) ||
        rec.get("squeeze_axis", spec.squeeze_axis) ||
        rec.get("scale_mult", spec.scale_mult) ||
        rec.get("scale_add", spec.scale_add) ||
        rec.get("coords", spec.coords) ||
        rec.get("derived", derived) ||
        rec.get("method", spec.method) ||
        rec.get("inputs", spec.inputs))
    {
        TCD_ERROR("The record for variable \"" << key
            << "\" was not validated with the variable schema")
        return tcd_error::config_error;
    }

    if (spec.name.empty())
        spec.name = key;

    spec.flip_lat = flip_lat;
    spec.flip_z = flip_z;
    spec.squeeze = squeeze;

    if (derived || !spec.method.empty())
    {
        spec.source = derived_source;
        if (spec.method.empty())
        {
            TCD_ERROR("Derived variable \"" << key << "\" has no method")
            return tcd_error::config_error;
        }
    }
    else
    {
        spec.source = file_source;
        if (spec.ncfile.empty() || spec.ncvarname.empty())
        {
            TCD_ERROR("Variable \"" << key << "\" is read from a file but "
                << (spec.ncfile.empty() ? "ncfile" : "ncvarname")
                << " was not provided")
            return tcd_error::config_error;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_variable_spec::from_document(const tcd_config_block &doc,
    const tcd_schema_registry &schemas, tcd_warning_log &log,
    std::vector<tcd_variable_spec> &specs, int verbose)
{
    int ierr = 0;
    std::vector<std::string> keys = doc.get_keys();
    for (const std::string &key : keys)
    {
        const tcd_config_block *block = doc.get_block(key);
        if (!block)
            continue;

        tcd_config_record rec;
        tcd_table table;
        int ret = 0;
        if ((ret = schemas.validate("variable", *block, rec, log, &table)))
        {
            TCD_ERROR("Variable \"" << key << "\" is invalid")
            ierr = ret;
            continue;
        }

        if (verbose)
        {
            TCD_STATUS("Variable \"" << key << "\"" << std::endl << table)
        }

        tcd_variable_spec spec;
        if ((ret = tcd_variable_spec::from_record(key, rec, spec)))
        {
            ierr = ret;
            continue;
        }

        specs.push_back(spec);
    }

    return ierr;
}

// --------------------------------------------------------------------------
void tcd_variable_spec::to_stream(std::ostream &os) const
{
    os << this->key << " (" << this->name << ") [" << this->units << "] ";
    if (this->is_derived())
    {
        os << "derived by " << this->method;
        if (!this->inputs.empty())
            os << " from " << this->inputs;
    }
    else
    {
        os << this->ncvarname << " in " << this->ncfile;
        if (this->flip_lat)
            os << " flip_lat";
        if (this->flip_z)
            os << " flip_z";
        if (this->squeeze)
            os << " squeeze " << this->squeeze_axis;
        if ((this->scale_mult != 1.0) || (this->scale_add != 0.0))
            os << " scale " << this->scale_mult << " " << this->scale_add;
    }
}

// --------------------------------------------------------------------------
int tcd_variable_spec::from_file(const std::string &file_name,
    const tcd_schema_registry &schemas, tcd_warning_log &log,
    std::vector<tcd_variable_spec> &specs, int verbose)
{
    int ierr = 0;
    tcd_config_block doc;
    if ((ierr = tcd_yaml_util::load(file_name, doc)))
        return ierr;

    if ((ierr = from_document(doc, schemas, log, specs, verbose)))
    {
        TCD_ERROR("Failed to load the variables declared in \""
            << file_name << "\"")
        return ierr;
    }

    return 0;
}
