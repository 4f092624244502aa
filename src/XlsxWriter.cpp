#include "XlsxWriter.h"
#include "DataFlowExceptions.h"
#include "DateTimeUtils.h"
#include "Encoding.h"
#include "TabularDataset.h"
#include "ZipArchive.h"

#include <cmath>
#include <sstream>

namespace {
constexpr const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPkgRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr long kEmuPerPixel = 9525;

std::string numberText(double v) {
    return TabularDataset::formatNumber(v, std::floor(v) == v && std::abs(v) < 1e15);
}

std::string cellXml(int row, int col, const Cell& cell) {
    const std::string ref = Worksheet::cellRef(row, col);
    const int style = static_cast<int>(cell.style);
    std::ostringstream out;
    out << "<c r=\"" << ref << "\"";
    if (style != 0) out << " s=\"" << style << "\"";

    if (const auto* s = std::get_if<std::string>(&cell.value)) {
        out << " t=\"inlineStr\"><is><t xml:space=\"preserve\">" << XlsxWriter::xmlEscape(*s) << "</t></is></c>";
    } else if (const auto* d = std::get_if<double>(&cell.value)) {
        if (!std::isfinite(*d)) return out.str() + "/>";
        out << "><v>" << numberText(*d) << "</v></c>";
    } else if (const auto* i = std::get_if<int64_t>(&cell.value)) {
        out << "><v>" << *i << "</v></c>";
    } else if (const auto* t = std::get_if<DateTimeCell>(&cell.value)) {
        out << "><v>" << numberText(DateTimeUtils::toSpreadsheetSerial(t->unixSeconds)) << "</v></c>";
    } else {
        out << "/>";
    }
    return out.str();
}
} // namespace

std::string XlsxWriter::xmlEscape(const std::string& raw) {
    const std::string text = Encoding::toValidUtf8(raw);
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        const unsigned char uc = static_cast<unsigned char>(ch);
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:
                // XML 1.0 forbids most C0 controls and the noncharacters U+FFFE and U+FFFF.
                if (uc < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') break;
                if (uc == 0xEF && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xBF &&
                    (static_cast<unsigned char>(text[i + 2]) & 0xFE) == 0xBE) {
                    i += 2;
                    break;
                }
                out.push_back(ch);
                break;
        }
    }
    return out;
}

std::string XlsxWriter::contentTypes(const Workbook& workbook) {
    std::ostringstream out;
    out << kXmlDecl
        << "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        << "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        << "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        << "<Default Extension=\"png\" ContentType=\"image/png\"/>"
        << "<Override PartName=\"/xl/workbook.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
        << "<Override PartName=\"/xl/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml\"/>";
    const auto& sheets = workbook.sheets();
    for (size_t i = 0; i < sheets.size(); ++i) {
        out << "<Override PartName=\"/xl/worksheets/sheet" << (i + 1)
            << ".xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>";
        if (!sheets[i].images().empty()) {
            out << "<Override PartName=\"/xl/drawings/drawing" << (i + 1)
                << ".xml\" ContentType=\"application/vnd.openxmlformats-officedocument.drawing+xml\"/>";
        }
    }
    out << "</Types>";
    return out.str();
}

std::string XlsxWriter::workbookXml(const Workbook& workbook) {
    std::ostringstream out;
    out << kXmlDecl << "<workbook xmlns=\"" << kMainNs << "\" xmlns:r=\"" << kRelNs << "\"><sheets>";
    const auto& sheets = workbook.sheets();
    for (size_t i = 0; i < sheets.size(); ++i) {
        out << "<sheet name=\"" << xmlEscape(sheets[i].name()) << "\" sheetId=\"" << (i + 1)
            << "\" r:id=\"rId" << (i + 1) << "\"/>";
    }
    out << "</sheets></workbook>";
    return out.str();
}

std::string XlsxWriter::workbookRels(const Workbook& workbook) {
    std::ostringstream out;
    out << kXmlDecl << "<Relationships xmlns=\"" << kPkgRelNs << "\">";
    const size_t n = workbook.sheets().size();
    for (size_t i = 0; i < n; ++i) {
        out << "<Relationship Id=\"rId" << (i + 1)
            << "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/sheet"
            << (i + 1) << ".xml\"/>";
    }
    out << "<Relationship Id=\"rId" << (n + 1)
        << "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>";
    out << "</Relationships>";
    return out.str();
}

std::string XlsxWriter::stylesXml() {
    std::ostringstream out;
    out << kXmlDecl << "<styleSheet xmlns=\"" << kMainNs << "\">"
        << "<fonts count=\"3\">"
        << "<font><sz val=\"11\"/><name val=\"Calibri\"/><family val=\"2\"/></font>"
        << "<font><b/><sz val=\"11\"/><name val=\"Calibri\"/><family val=\"2\"/></font>"
        << "<font><b/><sz val=\"14\"/><name val=\"Calibri\"/><family val=\"2\"/></font>"
        << "</fonts>"
        << "<fills count=\"2\"><fill><patternFill patternType=\"none\"/></fill>"
        << "<fill><patternFill patternType=\"gray125\"/></fill></fills>"
        << "<borders count=\"1\"><border><left/><right/><top/><bottom/><diagonal/></border></borders>"
        << "<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>"
        << "<cellXfs count=\"4\">"
        << "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\"/>"
        << "<xf numFmtId=\"0\" fontId=\"1\" fillId=\"0\" borderId=\"0\" xfId=\"0\" applyFont=\"1\"/>"
        << "<xf numFmtId=\"0\" fontId=\"2\" fillId=\"0\" borderId=\"0\" xfId=\"0\" applyFont=\"1\"/>"
        << "<xf numFmtId=\"22\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\" applyNumberFormat=\"1\"/>"
        << "</cellXfs>"
        << "<cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>"
        << "</styleSheet>";
    return out.str();
}

std::string XlsxWriter::sheetXml(const Worksheet& sheet, bool hasDrawing) {
    std::ostringstream out;
    out << kXmlDecl << "<worksheet xmlns=\"" << kMainNs << "\" xmlns:r=\"" << kRelNs << "\">";
    out << "<sheetViews><sheetView workbookViewId=\"0\"";
    if (!sheet.showGridLines()) out << " showGridLines=\"0\"";
    out << "/></sheetViews>";

    if (sheet.rows().empty()) {
        out << "<sheetData/>";
    } else {
        out << "<sheetData>";
        for (const auto& [row, cells] : sheet.rows()) {
            out << "<row r=\"" << row << "\">";
            for (const auto& [col, cell] : cells) out << cellXml(row, col, cell);
            out << "</row>";
        }
        out << "</sheetData>";
    }

    if (!sheet.merges().empty()) {
        out << "<mergeCells count=\"" << sheet.merges().size() << "\">";
        for (const auto& m : sheet.merges()) {
            out << "<mergeCell ref=\"" << Worksheet::cellRef(m.firstRow, m.firstCol) << ":"
                << Worksheet::cellRef(m.lastRow, m.lastCol) << "\"/>";
        }
        out << "</mergeCells>";
    }
    if (hasDrawing) out << "<drawing r:id=\"rId1\"/>";
    out << "</worksheet>";
    return out.str();
}

std::string XlsxWriter::drawingXml(const Worksheet& sheet, size_t firstImageId) {
    std::ostringstream out;
    out << kXmlDecl
        << "<xdr:wsDr xmlns:xdr=\"http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing\""
        << " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
        << " xmlns:r=\"" << kRelNs << "\">";
    const auto& images = sheet.images();
    for (size_t i = 0; i < images.size(); ++i) {
        const SheetImage& img = images[i];
        const size_t id = firstImageId + i;
        const std::string name = img.name.empty() ? "Image " + std::to_string(id) : img.name;
        out << "<xdr:oneCellAnchor>"
            << "<xdr:from><xdr:col>" << (img.col - 1) << "</xdr:col><xdr:colOff>0</xdr:colOff>"
            << "<xdr:row>" << (img.row - 1) << "</xdr:row><xdr:rowOff>0</xdr:rowOff></xdr:from>"
            << "<xdr:ext cx=\"" << img.widthPx * kEmuPerPixel << "\" cy=\"" << img.heightPx * kEmuPerPixel << "\"/>"
            << "<xdr:pic><xdr:nvPicPr><xdr:cNvPr id=\"" << (i + 1) << "\" name=\"" << xmlEscape(name) << "\"/>"
            << "<xdr:cNvPicPr><a:picLocks noChangeAspect=\"1\"/></xdr:cNvPicPr></xdr:nvPicPr>"
            << "<xdr:blipFill><a:blip r:embed=\"rId" << (i + 1) << "\"/><a:stretch><a:fillRect/></a:stretch></xdr:blipFill>"
            << "<xdr:spPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"" << img.widthPx * kEmuPerPixel
            << "\" cy=\"" << img.heightPx * kEmuPerPixel << "\"/></a:xfrm>"
            << "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></xdr:spPr>"
            << "</xdr:pic><xdr:clientData/></xdr:oneCellAnchor>";
    }
    out << "</xdr:wsDr>";
    return out.str();
}

std::string XlsxWriter::drawingRels(const Worksheet& sheet, size_t firstImageId) {
    std::ostringstream out;
    out << kXmlDecl << "<Relationships xmlns=\"" << kPkgRelNs << "\">";
    for (size_t i = 0; i < sheet.images().size(); ++i) {
        out << "<Relationship Id=\"rId" << (i + 1)
            << "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\" Target=\"../media/image"
            << (firstImageId + i) << ".png\"/>";
    }
    out << "</Relationships>";
    return out.str();
}

std::vector<uint8_t> XlsxWriter::write(const Workbook& workbook) {
    if (workbook.sheets().empty()) throw DataFlow::WorkbookException("A workbook needs at least one sheet");

    ZipArchive zip;
    zip.addFile("[Content_Types].xml", contentTypes(workbook));
    zip.addFile("_rels/.rels",
                std::string(kXmlDecl) + "<Relationships xmlns=\"" + kPkgRelNs + "\">" +
                "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"xl/workbook.xml\"/>" +
                "</Relationships>");
    zip.addFile("xl/workbook.xml", workbookXml(workbook));
    zip.addFile("xl/_rels/workbook.xml.rels", workbookRels(workbook));
    zip.addFile("xl/styles.xml", stylesXml());

    size_t nextImageId = 1;
    const auto& sheets = workbook.sheets();
    for (size_t i = 0; i < sheets.size(); ++i) {
        const Worksheet& sheet = sheets[i];
        const std::string index = std::to_string(i + 1);
        const bool hasDrawing = !sheet.images().empty();
        zip.addFile("xl/worksheets/sheet" + index + ".xml", sheetXml(sheet, hasDrawing));
        if (!hasDrawing) continue;

        zip.addFile("xl/worksheets/_rels/sheet" + index + ".xml.rels",
                    std::string(kXmlDecl) + "<Relationships xmlns=\"" + kPkgRelNs + "\">" +
                    "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/drawing\" Target=\"../drawings/drawing" +
                    index + ".xml\"/></Relationships>");
        zip.addFile("xl/drawings/drawing" + index + ".xml", drawingXml(sheet, nextImageId));
        zip.addFile("xl/drawings/_rels/drawing" + index + ".xml.rels", drawingRels(sheet, nextImageId));
        for (const auto& img : sheet.images()) {
            // PNG data is already deflated.
            zip.addFile("xl/media/image" + std::to_string(nextImageId++) + ".png", img.png, false);
        }
    }
    return zip.finish();
}
