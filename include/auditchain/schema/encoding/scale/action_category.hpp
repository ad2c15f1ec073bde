#pragma once

#include <auditchain/schema/action_category.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(auditchain::schema,
                             action_category_t,
                             auditchain::schema::action_category_t::data,
                             auditchain::schema::action_category_t::auth,
                             auditchain::schema::action_category_t::admin,
                             auditchain::schema::action_category_t::system)
