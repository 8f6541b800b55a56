// include/bus/sdbus_codec.hpp
#pragma once
#include <string>

#include <systemd/sd-bus.h>

#include "bus/ibus.hpp"

namespace bus
{

// variant of a basic type -> Property; container variants are skipped (supported=false)
int read_variant(sd_bus_message *m, Property &out, bool &supported);
// a{sv}
int read_property_bag(sd_bus_message *m, PropertyBag &out);
// a{oa{sa{sv}}} (GetManagedObjects reply body)
int read_managed_objects(sd_bus_message *m, ManagedObjects &out);
// (s a{sv} as) (PropertiesChanged signal body)
int read_properties_changed(sd_bus_message *m, PropertiesChanged &out);

// map a failed sd-bus call onto the error taxonomy
CallResult classify_failure(int r, const sd_bus_error &err);

}  // namespace bus
