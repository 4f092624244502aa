#pragma once
#include "Workbook.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Serializes a Workbook to Office Open XML (.xlsx) bytes.
 * @details Strings are written inline, datetimes as serial numbers with a date-time
 * number format, images through one drawing part per sheet.
 */
class XlsxWriter {
public:
    /**
     * @throws DataFlow::WorkbookException when the workbook has no sheets or archiving fails.
     */
    static std::vector<uint8_t> write(const Workbook& workbook);

    // Escapes markup characters, drops characters XML 1.0 forbids, replaces invalid UTF-8 with U+FFFD.
    static std::string xmlEscape(const std::string& text);

private:
    static std::string contentTypes(const Workbook& workbook);
    static std::string workbookXml(const Workbook& workbook);
    static std::string workbookRels(const Workbook& workbook);
    static std::string stylesXml();
    static std::string sheetXml(const Worksheet& sheet, bool hasDrawing);
    static std::string drawingXml(const Worksheet& sheet, size_t firstImageId);
    static std::string drawingRels(const Worksheet& sheet, size_t firstImageId);
};
