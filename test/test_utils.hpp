#pragma once

#include <jsonq/value.hpp>

namespace test_utils {

using jsonq::Value;

// {"issue_event_type_name": "issue_assigned",
//  "issue": {"fields": {"project": {"name": "Operations"}},
//            "key": "OP-1", "count": 42,
//            "changelog": {"items": [{"fieldId": "assignee",
//                                     "toString": "Veijo Linux",
//                                     "fromString": null}]}}}
inline Value issue_document() {
  return Value::mapping({
    { "issue_event_type_name", "issue_assigned" },
    { "issue", Value::mapping({
      { "fields", Value::mapping({
        { "project", Value::mapping({ { "name", "Operations" } }) },
      }) },
      { "key", "OP-1" },
      { "count", 42 },
      { "changelog", Value::mapping({
        { "items", Value::sequence({
          Value::mapping({
            { "fieldId", "assignee" },
            { "toString", "Veijo Linux" },
            { "fromString", nullptr },
          }),
        }) },
      }) },
    }) },
  });
}

// {"items": [{"fieldId": "assignee", "toString": "A", "fromString": null},
//            {"fieldId": "assignee", "toString": "B", "fromString": "A"}]}
inline Value assignee_changes() {
  return Value::mapping({
    { "items", Value::sequence({
      Value::mapping({
        { "fieldId", "assignee" },
        { "toString", "A" },
        { "fromString", nullptr },
      }),
      Value::mapping({
        { "fieldId", "assignee" },
        { "toString", "B" },
        { "fromString", "A" },
      }),
    }) },
  });
}

// {"items": [{"name": "low", "priority": 10, "status": "open"},
//            {"name": "edge", "priority": 100, "status": "closed"},
//            {"name": "high", "priority": 500, "status": "open"},
//            {"name": "mid", "priority": 50, "status": "review"}]}
inline Value prioritized_items() {
  auto item = [](const char *name, int priority, const char *status) {
    return Value::mapping({
      { "name", name },
      { "priority", priority },
      { "status", status },
    });
  };
  return Value::mapping({
    { "items", Value::sequence({
      item("low", 10, "open"),
      item("edge", 100, "closed"),
      item("high", 500, "open"),
      item("mid", 50, "review"),
    }) },
  });
}

} // namespace test_utils
