#include "bus/sdbus_codec.hpp"

#include <cerrno>
#include <cstring>

namespace bus
{
namespace
{

bool is_basic_tag(char t)
{
    switch (t)
    {
        case 's':
        case 'o':
        case 'b':
        case 'y':
        case 'n':
        case 'q':
        case 'i':
        case 'u':
        case 'x':
        case 't':
            return true;
        default:
            return false;
    }
}

// names that mean "the peer never got to answer"
bool is_transport_error_name(const char *name)
{
    if (!name || !*name)
        return true;
    if (std::strncmp(name, "System.Error.", 13) == 0)
        return true;
    return std::strcmp(name, SD_BUS_ERROR_NO_REPLY) == 0 ||
           std::strcmp(name, SD_BUS_ERROR_DISCONNECTED) == 0 ||
           std::strcmp(name, SD_BUS_ERROR_TIMEOUT) == 0 ||
           std::strcmp(name, "org.freedesktop.DBus.Error.TimedOut") == 0 ||
           std::strcmp(name, SD_BUS_ERROR_NO_SERVER) == 0;
}

template <typename T>
int read_basic_into(sd_bus_message *m, char tag, Property &out)
{
    T   v{};
    int r = sd_bus_message_read_basic(m, tag, &v);
    if (r < 0)
        return r;
    out.value = v;
    return 0;
}

}  // namespace

int read_variant(sd_bus_message *m, Property &out, bool &supported)
{
    char        type     = 0;
    const char *contents = nullptr;
    int         r        = sd_bus_message_peek_type(m, &type, &contents);
    if (r < 0)
        return r;
    if (r == 0 || type != SD_BUS_TYPE_VARIANT || !contents)
        return -EINVAL;

    if (std::strlen(contents) != 1 || !is_basic_tag(contents[0]))
    {
        supported = false;
        return sd_bus_message_skip(m, "v");
    }
    supported = true;

    const char tag = contents[0];
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0)
        return r;

    out.type = tag;
    switch (tag)
    {
        case 's':
        case 'o':
        {
            const char *s = nullptr;
            r             = sd_bus_message_read_basic(m, tag, &s);
            if (r >= 0)
                out.value = std::string(s ? s : "");
            break;
        }
        case 'b':
        {
            int b = 0;
            r     = sd_bus_message_read_basic(m, tag, &b);
            if (r >= 0)
                out.value = (b != 0);
            break;
        }
        case 'y':
            r = read_basic_into<std::uint8_t>(m, tag, out);
            break;
        case 'n':
            r = read_basic_into<std::int16_t>(m, tag, out);
            break;
        case 'q':
            r = read_basic_into<std::uint16_t>(m, tag, out);
            break;
        case 'i':
            r = read_basic_into<std::int32_t>(m, tag, out);
            break;
        case 'u':
            r = read_basic_into<std::uint32_t>(m, tag, out);
            break;
        case 'x':
            r = read_basic_into<std::int64_t>(m, tag, out);
            break;
        case 't':
            r = read_basic_into<std::uint64_t>(m, tag, out);
            break;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int read_property_bag(sd_bus_message *m, PropertyBag &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        Property prop;
        bool     supported = false;
        if ((r = read_variant(m, prop, supported)) < 0)
            return r;
        if (supported && key)
            out[key] = std::move(prop);

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sv}
}

int read_managed_objects(sd_bus_message *m, ManagedObjects &out)
{
    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(m, "o", &obj)) < 0)
            return r;
        if (!obj)
            return -EINVAL;

        ManagedObject mo;
        mo.path = obj;

        if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            return r;
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
                return r;
            PropertyBag bag;
            if ((r = read_property_bag(m, bag)) < 0)
                return r;
            if (iface)
                mo.interfaces.emplace(iface, std::move(bag));
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // {oa{sa{sv}}}

        out.push_back(std::move(mo));
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int read_properties_changed(sd_bus_message *m, PropertiesChanged &out)
{
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    out.interface = iface ? iface : "";

    if ((r = read_property_bag(m, out.changed)) < 0)
        return r;

    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s")) < 0)
        return r;
    while (true)
    {
        const char *name = nullptr;
        int         rr   = sd_bus_message_read_basic(m, 's', &name);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (name)
            out.invalidated.emplace_back(name);
    }
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    out.path         = path ? path : "";
    return 0;
}

CallResult classify_failure(int r, const sd_bus_error &err)
{
    if (sd_bus_error_is_set(&err) && !is_transport_error_name(err.name))
        return CallResult::error_reply(err.name, err.message ? err.message : "");

    std::string msg = err.message ? err.message : std::strerror(-r);
    if (err.name && *err.name)
        msg = std::string(err.name) + ": " + msg;
    return CallResult::transport_error(std::move(msg));
}

}  // namespace bus
