#pragma once

#include <auditchain/schema/audit_action.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(auditchain::schema,
                             audit_action_t,
                             auditchain::schema::audit_action_t::create,
                             auditchain::schema::audit_action_t::update,
                             auditchain::schema::audit_action_t::remove,
                             auditchain::schema::audit_action_t::view,
                             auditchain::schema::audit_action_t::login,
                             auditchain::schema::audit_action_t::logout,
                             auditchain::schema::audit_action_t::approve,
                             auditchain::schema::audit_action_t::reject,
                             auditchain::schema::audit_action_t::exported)
