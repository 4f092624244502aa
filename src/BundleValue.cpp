#include "BundleValue.h"
#include "DateTimeUtils.h"
#include "Encoding.h"
#include "TabularDataset.h"

#include <cmath>

BundleValue& BundleValue::set(const std::string& key, BundleValue v) {
    Object& obj = std::get<Object>(value_);
    for (auto& kv : obj) {
        if (kv.first == key) {
            kv.second = std::move(v);
            return kv.second;
        }
    }
    obj.emplace_back(key, std::move(v));
    return obj.back().second;
}

const BundleValue* BundleValue::find(const std::string& key) const {
    const Object* obj = std::get_if<Object>(&value_);
    if (!obj) return nullptr;
    for (const auto& kv : *obj) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

void BundleValue::push(BundleValue v) {
    std::get<Array>(value_).push_back(std::move(v));
}

size_t BundleValue::size() const {
    if (const Array* a = std::get_if<Array>(&value_)) return a->size();
    if (const Object* o = std::get_if<Object>(&value_)) return o->size();
    return 0;
}

std::string BundleValue::toJson(int indent) const {
    std::string out;
    write(out, indent, 0);
    return out;
}

void BundleValue::write(std::string& out, int indent, int depth) const {
    auto newline = [&](int level) {
        if (indent < 0) return;
        out.push_back('\n');
        out.append(static_cast<size_t>(indent * level), ' ');
    };
    const char* colon = indent < 0 ? ":" : ": ";

    switch (value_.index()) {
        case 0:
            out += "null";
            break;
        case 1:
            out += std::get<bool>(value_) ? "true" : "false";
            break;
        case 2:
            out += std::to_string(std::get<int64_t>(value_));
            break;
        case 3: {
            const double d = std::get<double>(value_);
            out += std::isfinite(d) ? TabularDataset::formatNumber(d, false) : "null";
            break;
        }
        case 4:
            out += "\"" + Encoding::jsonEscape(std::get<std::string>(value_)) + "\"";
            break;
        case 5:
            out += "\"" + DateTimeUtils::toIsoString(std::get<DateTime>(value_).unixSeconds) + "\"";
            break;
        case 6: {
            const Array& arr = std::get<Array>(value_);
            if (arr.empty()) {
                out += "[]";
                break;
            }
            out.push_back('[');
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i) out.push_back(',');
                newline(depth + 1);
                arr[i].write(out, indent, depth + 1);
            }
            newline(depth);
            out.push_back(']');
            break;
        }
        default: {
            const Object& obj = std::get<Object>(value_);
            if (obj.empty()) {
                out += "{}";
                break;
            }
            out.push_back('{');
            for (size_t i = 0; i < obj.size(); ++i) {
                if (i) out.push_back(',');
                newline(depth + 1);
                out += "\"" + Encoding::jsonEscape(obj[i].first) + "\"" + colon;
                obj[i].second.write(out, indent, depth + 1);
            }
            newline(depth);
            out.push_back('}');
            break;
        }
    }
}
