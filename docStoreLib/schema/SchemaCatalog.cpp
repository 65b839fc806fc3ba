#include <docstore/schema/SchemaRegistry.hpp>

// 기록 애플리케이션의 엔티티 스키마 목록.
// 모든 스키마는 닫혀 있다: fields에 없는 필드는 저장 전에 제거된다.

namespace DocStore {

namespace {

using F = FieldSpec;

FieldSpec nullableInt(const char* name) { return F::integer(name).orNull(); }
FieldSpec nullableText(const char* name) { return F::string(name).orNull(); }
FieldSpec nullableNumber(const char* name) { return F::number(name).orNull(); }
FieldSpec nonNegative(const char* name) { return F::number(name).orNull().min(0); }
FieldSpec tasteScale(const char* name) { return F::integer(name).orNull().min(1).max(10); }
FieldSpec halfStarRating(const char* name) { return F::number(name).orNull().min(0).max(5).multipleOf(0.5); }

void addAudit(std::vector<FieldSpec>& fields) {
    fields.push_back(F::integer("id").min(1));
    fields.push_back(F::string("created_at"));
    fields.push_back(F::string("updated_at"));
}

EntitySchema lookupSchema(const char* entity, std::vector<FieldSpec> extra = {}) {
    EntitySchema s;
    s.entity = entity;
    s.lookup = true;
    s.required = {"name"};
    addAudit(s.fields);
    s.fields.push_back(F::string("name").minLength(1));
    s.fields.push_back(nullableText("short_form"));
    s.fields.push_back(nullableText("description"));
    s.fields.push_back(nullableText("notes"));
    s.fields.push_back(nullableText("url"));
    s.fields.push_back(nullableText("image_url"));
    s.fields.push_back(nullableText("icon"));
    s.fields.push_back(F::boolean("is_default"));
    for (auto& f : extra)
        s.fields.push_back(std::move(f));
    return s;
}

EntitySchema products() {
    EntitySchema s;
    s.entity = "products";
    s.required = {"product_name"};
    addAudit(s.fields);
    s.fields.push_back(nullableInt("roaster_id"));
    s.fields.push_back(F::array("bean_type_id", FieldType::Integer));
    s.fields.push_back(nullableInt("country_id"));
    s.fields.push_back(F::array("region_id", FieldType::Integer));
    s.fields.push_back(F::string("product_name").minLength(1));
    s.fields.push_back(F::integer("roast_type").orNull().min(1).max(10));
    s.fields.push_back(nullableText("description"));
    s.fields.push_back(nullableText("url"));
    s.fields.push_back(nullableText("image_url"));
    s.fields.push_back(F::boolean("decaf"));
    s.fields.push_back(nullableInt("decaf_method_id"));
    s.fields.push_back(halfStarRating("rating"));
    s.fields.push_back(F::array("bean_process", FieldType::String)
                           .orNull()
                           .itemsOneOf({"Washed (wet)", "Natural (dry)", "Honey",
                                        "Semi-washed (wet-hulled)", "Anaerobic",
                                        "Carbonic Maceration", "Other"})
                           .unique());
    s.fields.push_back(nullableText("notes"));
    return s;
}

EntitySchema batches() {
    EntitySchema s;
    s.entity = "batches";
    s.required = {"product_id", "roast_date"};
    addAudit(s.fields);
    s.fields.push_back(F::integer("product_id"));
    s.fields.push_back(F::string("roast_date").date());
    s.fields.push_back(F::string("purchase_date").orNull().date());
    s.fields.push_back(nonNegative("amount_grams"));
    s.fields.push_back(nonNegative("price"));
    s.fields.push_back(nullableText("seller"));
    s.fields.push_back(nullableText("notes"));
    s.fields.push_back(halfStarRating("rating"));
    s.fields.push_back(F::boolean("is_active"));
    return s;
}

EntitySchema brewSessions() {
    EntitySchema s;
    s.entity = "brew_sessions";
    addAudit(s.fields);
    s.fields.push_back(F::string("timestamp"));
    for (const char* ref : {"product_batch_id", "product_id", "brew_method_id", "brewer_id", "recipe_id",
                            "grinder_id", "filter_id", "kettle_id", "scale_id"})
        s.fields.push_back(nullableInt(ref));
    s.fields.push_back(nonNegative("amount_coffee_grams"));
    s.fields.push_back(nonNegative("amount_water_grams"));
    s.fields.push_back(nullableNumber("brew_temperature_c"));
    s.fields.push_back(nonNegative("bloom_time_seconds"));
    s.fields.push_back(nonNegative("brew_time_seconds"));
    for (const char* taste : {"sweetness", "acidity", "bitterness", "body", "aroma", "flavor_profile_match"})
        s.fields.push_back(tasteScale(taste));
    s.fields.push_back(nullableText("notes"));
    s.fields.push_back(F::number("score").orNull().min(1.0).max(10.0));
    s.fields.push_back(F::string("grinder_setting").also(FieldType::Number).orNull());
    return s;
}

EntitySchema shots() {
    EntitySchema s;
    s.entity = "shots";
    s.required = {"dose_grams", "yield_grams"};
    addAudit(s.fields);
    s.fields.push_back(F::string("timestamp"));
    for (const char* ref : {"product_batch_id", "product_id", "shot_session_id", "brewer_id", "grinder_id",
                            "portafilter_id", "basket_id", "tamper_id", "wdt_tool_id", "leveling_tool_id",
                            "scale_id", "recipe_id"})
        s.fields.push_back(nullableInt(ref));
    s.fields.push_back(F::number("dose_grams").min(0));
    s.fields.push_back(F::number("yield_grams").min(0));
    s.fields.push_back(nonNegative("preinfusion_seconds"));
    s.fields.push_back(nonNegative("extraction_time_seconds"));
    s.fields.push_back(nonNegative("brew_time_seconds"));
    s.fields.push_back(nonNegative("pressure_bars"));
    s.fields.push_back(nullableNumber("water_temperature_c"));
    s.fields.push_back(nullableNumber("temperature_c"));
    s.fields.push_back(F::string("grinder_setting").also(FieldType::Number).orNull());
    for (const char* taste :
         {"sweetness", "acidity", "bitterness", "body", "aroma", "crema", "flavor_profile_match"})
        s.fields.push_back(tasteScale(taste));
    s.fields.push_back(nullableText("extraction_status")
                           .oneOf({"channeling", "over-extracted", "under-extracted", "perfect", "balanced"}));
    s.fields.push_back(nullableText("notes"));
    s.fields.push_back(F::number("score").orNull().min(1.0).max(10.0));
    s.fields.push_back(F::number("overall_score").orNull().min(0).max(10));
    s.fields.push_back(nullableText("ratio"));
    return s;
}

EntitySchema shotSessions() {
    EntitySchema s;
    s.entity = "shot_sessions";
    s.required = {"title"};
    addAudit(s.fields);
    s.fields.push_back(F::string("title").minLength(1));
    s.fields.push_back(nullableInt("product_id"));
    s.fields.push_back(nullableInt("product_batch_id"));
    s.fields.push_back(nullableInt("brewer_id"));
    s.fields.push_back(nullableText("notes"));
    return s;
}

} // namespace

SchemaRegistry SchemaRegistry::withBuiltinSchemas() {
    SchemaRegistry r;
    r.registerSchema(products());
    r.registerSchema(batches());
    r.registerSchema(brewSessions());
    r.registerSchema(shots());
    r.registerSchema(shotSessions());

    for (const char* plain : {"roasters", "bean_types", "countries", "decaf_methods", "scales", "leveling_tools"})
        r.registerSchema(lookupSchema(plain));

    r.registerSchema(lookupSchema(
        "brew_methods",
        {nullableText("brew_time_range"), nullableText("water_temperature"), nullableText("grind_size")}));
    r.registerSchema(lookupSchema(
        "recipes", {nullableText("coffee_ratio"), nullableText("instructions"), nullableText("brew_method")}));
    r.registerSchema(lookupSchema("grinders", {nullableText("brand"), nullableText("grinder_type"),
                                               nullableText("burr_material"), nullableText("product_url"),
                                               nonNegative("manually_ground_grams")}));
    r.registerSchema(lookupSchema(
        "filters", {nullableText("material"), nullableText("brand"), nullableText("compatibility")}));
    r.registerSchema(lookupSchema("kettles", {nullableText("brand"), nullableText("capacity"),
                                              nullableText("kettle_type"), nullableText("product_url")}));
    r.registerSchema(
        lookupSchema("brewers", {nullableText("type"), nullableText("brand"), nullableText("model")}));
    r.registerSchema(lookupSchema("portafilters",
                                  {nullableText("size"), nullableInt("size_mm"),
                                   F::boolean("bottomless").orNull(), nullableText("brand"),
                                   nullableText("material"), nullableText("handle_type")}));
    r.registerSchema(lookupSchema(
        "baskets", {nullableText("basket_type"), nullableInt("hole_count"), nullableNumber("capacity_grams"),
                    F::boolean("pressurized").orNull(), nullableText("size"), nullableText("brand"),
                    nullableText("material"), nullableInt("holes")}));
    r.registerSchema(lookupSchema("tampers", {nullableText("size"), nullableNumber("weight"),
                                              nullableText("handle_material"), nullableText("base_material"),
                                              nullableText("brand")}));
    r.registerSchema(lookupSchema("wdt_tools", {nullableInt("needle_count"),
                                                F::string("needle_diameter").also(FieldType::Number).orNull(),
                                                nullableText("brand"), nullableText("handle_material")}));

    EntitySchema regions = lookupSchema("regions", {F::integer("country_id")});
    regions.required = {"name", "country_id"};
    r.registerSchema(std::move(regions));
    return r;
}

} // namespace DocStore
