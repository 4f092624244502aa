#include "BundleSerializer.h"
#include "DataFlowExceptions.h"
#include "DateTimeUtils.h"
#include "Encoding.h"
#include "ZipArchive.h"

#include <initializer_list>

namespace {
BundleValue cellValue(const TypedColumn& col, size_t row) {
    if (col.missing[row]) return BundleValue(nullptr);
    switch (col.kind) {
        case ColumnKind::NUMERIC: {
            const double v = std::get<std::vector<double>>(col.values)[row];
            if (col.integral) return BundleValue(static_cast<int64_t>(v));
            return BundleValue(v);
        }
        case ColumnKind::DATETIME:
            return BundleValue(BundleValue::DateTime{std::get<std::vector<int64_t>>(col.values)[row]});
        default:
            return BundleValue(std::get<std::vector<std::string>>(col.values)[row]);
    }
}

BundleValue stringArray(const std::vector<std::string>& items) {
    BundleValue out = BundleValue::array();
    for (const auto& item : items) out.push(item);
    return out;
}
} // namespace

BundleValue BundleSerializer::cleanedRecords(const TabularDataset& cleaned) {
    BundleValue records = BundleValue::array();
    const auto& columns = cleaned.columns();
    for (size_t r = 0; r < cleaned.rowCount(); ++r) {
        BundleValue record = BundleValue::object();
        for (const auto& col : columns) record.set(col.name, cellValue(col, r));
        records.push(std::move(record));
    }
    return records;
}

BundleValue BundleSerializer::pivotTableValue(const PivotTable& pivot) {
    BundleValue out = BundleValue::object();
    out.set("title", pivot.title);
    out.set("index_column", pivot.indexColumn);
    out.set("column_headers", stringArray(pivot.headers));

    BundleValue data = BundleValue::array();
    for (const auto& rec : pivot.records()) {
        BundleValue row = BundleValue::object();
        row.set("index", rec.index);
        for (const auto& kv : rec.values) row.set(kv.first, kv.second);
        data.push(std::move(row));
    }
    out.set("data", std::move(data));
    return out;
}

BundleValue BundleSerializer::chartValue(const ChartSpec& chart) {
    BundleValue out = BundleValue::object();
    out.set("title", chart.title);
    out.set("chart_title", chart.chartTitle);
    out.set("kind", chartKindName(chart.kind));
    out.set("backend", renderBackendName(chart.backend));
    out.set("has_image", chart.hasImage());
    out.set("figure", chart.description ? *chart.description : BundleValue(nullptr));
    return out;
}

BundleValue BundleSerializer::makeJsonSafe(const BundleValue& value) {
    if (value.isDateTime()) {
        return BundleValue(DateTimeUtils::toIsoString(value.asDateTime().unixSeconds));
    }
    if (value.isArray()) {
        BundleValue out = BundleValue::array();
        for (const auto& item : value.asArray()) out.push(makeJsonSafe(item));
        return out;
    }
    if (value.isObject()) {
        BundleValue out = BundleValue::object();
        for (const auto& kv : value.asObject()) out.set(kv.first, makeJsonSafe(kv.second));
        return out;
    }
    return value;
}

BundleValue BundleSerializer::toBundleValue(const ResultBundle& bundle) {
    BundleValue out = BundleValue::object();
    out.set("cleaned_data", cleanedRecords(bundle.cleaned));

    BundleValue pivots = BundleValue::array();
    for (const auto& pivot : bundle.pivots) pivots.push(pivotTableValue(pivot));
    out.set("pivot_tables", std::move(pivots));

    out.set("has_dashboard", bundle.hasDashboard);
    out.set("sheets", stringArray(bundle.sheetNames));
    out.set("file_content_base64", Encoding::base64Encode(bundle.workbook));
    out.set("file_name", bundle.fileName);
    out.set("requested_relations", bundle.requestedRelations);
    out.set("generated_relations", bundle.generatedRelations);
    out.set("description", bundle.description);
    out.set("file_sha1", Encoding::sha1Hex(bundle.workbook));
    out.set("file_size", bundle.workbook.size());

    BundleValue profiles = BundleValue::array();
    for (const auto& p : bundle.profiles) {
        BundleValue entry = BundleValue::object();
        entry.set("name", p.name);
        entry.set("kind", columnKindName(p.kind));
        entry.set("role", columnRoleName(p.role));
        entry.set("datetime_like", p.datetimeLike);
        entry.set("distinct_count", p.distinctCount);
        profiles.push(std::move(entry));
    }
    out.set("column_profiles", std::move(profiles));

    if (bundle.hasDashboard) {
        BundleValue charts = BundleValue::array();
        for (const auto& chart : bundle.charts) charts.push(chartValue(chart));
        out.set("charts", std::move(charts));
    }
    return makeJsonSafe(out);
}

std::string BundleSerializer::toJson(const ResultBundle& bundle, int indent) {
    return toBundleValue(bundle).toJson(indent);
}

std::vector<uint8_t> BundleSerializer::decodeWorkbook(const BundleValue& bundle) {
    const BundleValue* field = bundle.find("file_content_base64");
    if (!field || !field->isString()) {
        throw DataFlow::WorkbookException("Bundle has no file_content_base64 field");
    }
    std::vector<uint8_t> bytes;
    if (!Encoding::base64Decode(field->asString(), bytes)) {
        throw DataFlow::WorkbookException("file_content_base64 is not valid base64");
    }
    const auto parts = ZipArchive::extract(bytes);
    for (const char* required : {"[Content_Types].xml", "xl/workbook.xml"}) {
        if (parts.count(required) == 0) {
            throw DataFlow::WorkbookException(std::string("Embedded workbook has no ") + required + " part");
        }
    }
    return bytes;
}
