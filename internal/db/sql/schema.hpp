#pragma once

#include <array>

namespace opentimeline::db::sql {

/*
  Canonical timeline schema used by all SQL backends.

  IMPORTANT:
  These are written in a SQLite/Postgres compatible subset so both
  engines bootstrap from the same statements. Subtimeline edges and
  timeline-entity links deliberately carry no self-reference or cycle
  constraint: the resolver guards against cycles at traversal time.
*/

static constexpr std::array<const char*, 12> kBootstrapSchema = {
    "CREATE TABLE IF NOT EXISTS entities ("
    " id TEXT NOT NULL PRIMARY KEY,"
    " name TEXT NOT NULL UNIQUE,"
    " start_year INTEGER NOT NULL,"
    " start_month SMALLINT,"
    " start_day SMALLINT,"
    " end_year INTEGER,"
    " end_month SMALLINT,"
    " end_day SMALLINT);",

    "CREATE TABLE IF NOT EXISTS entity_tags ("
    " entity_id TEXT NOT NULL,"
    " name TEXT,"
    " value TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS timelines ("
    " id TEXT NOT NULL PRIMARY KEY,"
    " name TEXT NOT NULL UNIQUE,"
    " bool_expression TEXT);",

    "CREATE TABLE IF NOT EXISTS subtimelines ("
    " timeline_parent_id TEXT NOT NULL,"
    " timeline_child_id TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS timeline_entities ("
    " timeline_id TEXT NOT NULL,"
    " entity_id TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS timeline_tags ("
    " timeline_id TEXT NOT NULL,"
    " name TEXT,"
    " value TEXT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_entities_start_year ON entities(start_year);",
    "CREATE INDEX IF NOT EXISTS idx_entity_tags_entity_id ON entity_tags(entity_id);",
    "CREATE INDEX IF NOT EXISTS idx_entity_tags_name ON entity_tags(name);",
    "CREATE INDEX IF NOT EXISTS idx_subtimelines_parent ON subtimelines(timeline_parent_id);",
    "CREATE INDEX IF NOT EXISTS idx_timeline_entities_timeline ON timeline_entities(timeline_id);",
    "CREATE INDEX IF NOT EXISTS idx_timeline_tags_timeline ON timeline_tags(timeline_id);",
};

} // namespace opentimeline::db::sql
