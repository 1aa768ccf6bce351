// =====================================================================
//  src/liblasercam/importer/svg.cpp — SVG import
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/importer/svg.h>
#include <lasercam/geometry/utils.h>
#include <lasercam/log.h>

#include <QFile>
#include <QHash>
#include <QRegularExpression>
#include <QXmlStreamReader>

namespace lasercam {
namespace importer {

using geometry::PathSegment;
using geometry::Transform2D;

namespace {

// =====================================================================
//  Path data tokenizer
// =====================================================================

void skipSeparators(const QString& data, int& pos)
{
    while (pos < data.length() &&
           (data[pos].isSpace() || data[pos] == ',')) {
        ++pos;
    }
}

/// Parse a number from SVG path data
double parseNumber(const QString& data, int& pos, bool& ok)
{
    skipSeparators(data, pos);

    if (pos >= data.length()) {
        ok = false;
        return 0.0;
    }

    int start = pos;

    // Handle sign
    if (data[pos] == '-' || data[pos] == '+') {
        ++pos;
    }

    // Integer part
    int digits = 0;
    while (pos < data.length() && data[pos].isDigit()) {
        ++pos;
        ++digits;
    }

    // Decimal part
    if (pos < data.length() && data[pos] == '.') {
        ++pos;
        while (pos < data.length() && data[pos].isDigit()) {
            ++pos;
            ++digits;
        }
    }

    if (digits == 0) {
        pos = start;
        ok = false;
        return 0.0;
    }

    // Exponent
    if (pos < data.length() && (data[pos] == 'e' || data[pos] == 'E')) {
        int expStart = pos;
        ++pos;
        if (pos < data.length() && (data[pos] == '-' || data[pos] == '+')) {
            ++pos;
        }
        int expDigits = 0;
        while (pos < data.length() && data[pos].isDigit()) {
            ++pos;
            ++expDigits;
        }
        if (expDigits == 0) {
            pos = expStart;
        }
    }

    bool converted = false;
    double value = data.mid(start, pos - start).toDouble(&converted);
    if (!converted || !qIsFinite(value)) {
        ok = false;
        return 0.0;
    }
    return value;
}

/// Parse a flag (0 or 1) for arc commands
bool parseFlag(const QString& data, int& pos, bool& ok)
{
    skipSeparators(data, pos);
    if (pos < data.length() && (data[pos] == '0' || data[pos] == '1')) {
        return data[pos++] == '1';
    }
    ok = false;
    return false;
}

/// True when the next token starts a number
bool numberFollows(const QString& data, int pos)
{
    skipSeparators(data, pos);
    if (pos >= data.length()) return false;
    QChar c = data[pos];
    return c.isDigit() || c == '-' || c == '+' || c == '.';
}

// =====================================================================
//  Presentation attributes
// =====================================================================

/// Inherited presentation state
struct Style {
    std::optional<QString> fill;
    std::optional<QString> stroke;
    std::optional<QString> strokeWidth;
};

/// Traversal state of one open element
struct Frame {
    Transform2D transform;
    Style style;
};

using AttributeMap = QHash<QString, QString>;

/// Collect attributes, letting entries of the style attribute win
AttributeMap collectAttributes(const QXmlStreamAttributes& attributes)
{
    AttributeMap map;
    for (const QXmlStreamAttribute& attr : attributes) {
        map.insert(attr.name().toString(), attr.value().toString().trimmed());
    }

    const QString style = map.value(QStringLiteral("style"));
    if (!style.isEmpty()) {
        const QStringList declarations = style.split(QLatin1Char(';'), Qt::SkipEmptyParts);
        for (const QString& decl : declarations) {
            int colon = decl.indexOf(QLatin1Char(':'));
            if (colon <= 0) continue;
            map.insert(decl.left(colon).trimmed(), decl.mid(colon + 1).trimmed());
        }
    }
    return map;
}

bool isPaint(const std::optional<QString>& value)
{
    return value.has_value() && !value->isEmpty() &&
           value->compare(QLatin1String("none"), Qt::CaseInsensitive) != 0;
}

/// Leading number of a length ("12.5mm" -> 12.5)
std::optional<double> parseLength(const QString& text)
{
    static const QRegularExpression re(
        QStringLiteral("^\\s*([-+]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][-+]?\\d+)?)"));
    QRegularExpressionMatch match = re.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toDouble();
}

/// Every number in a list attribute (points, viewBox)
std::optional<QVector<double>> parseNumberList(const QString& text)
{
    QVector<double> values;
    int pos = 0;
    skipSeparators(text, pos);
    while (pos < text.length()) {
        bool ok = true;
        double v = parseNumber(text, pos, ok);
        if (!ok) return std::nullopt;
        values.append(v);
        skipSeparators(text, pos);
    }
    return values;
}

// =====================================================================
//  Document walker
// =====================================================================

class SVGWalker {
public:
    explicit SVGWalker(const SVGImportOptions& options) : m_options(options) {}

    ImportResult run(const QString& content);

private:
    bool handleRoot(const AttributeMap& attrs);
    bool handleShape(const QString& tag, const AttributeMap& attrs, const Frame& frame);
    bool number(const AttributeMap& attrs, const QString& name, double& out);
    void addShape(const QVector<QPointF>& local, bool closed,
                  const Frame& frame, bool isPath);

    SVGImportOptions m_options;
    QVector<Frame> m_stack;
    QVector<Polyline> m_polylines;
    ImportResult m_result;
    QString m_error;
};

const QStringList& skippedTags()
{
    static const QStringList tags = {
        QStringLiteral("defs"), QStringLiteral("clipPath"), QStringLiteral("mask"),
        QStringLiteral("marker"), QStringLiteral("symbol"), QStringLiteral("use"),
        QStringLiteral("style"), QStringLiteral("title")
    };
    return tags;
}

const QStringList& unsupportedTags()
{
    static const QStringList tags = {
        QStringLiteral("text"), QStringLiteral("image"), QStringLiteral("pattern"),
        QStringLiteral("linearGradient"), QStringLiteral("radialGradient")
    };
    return tags;
}

bool SVGWalker::number(const AttributeMap& attrs, const QString& name, double& out)
{
    auto it = attrs.constFind(name);
    if (it == attrs.constEnd() || it->isEmpty()) {
        out = 0.0;
        return true;
    }
    std::optional<double> value = parseLength(*it);
    if (!value) {
        m_error = QStringLiteral("Invalid number in attribute %1: \"%2\"").arg(name, *it);
        return false;
    }
    out = *value;
    return true;
}

bool SVGWalker::handleRoot(const AttributeMap& attrs)
{
    Transform2D root = Transform2D::translation(m_options.offset.x(), m_options.offset.y()) *
                       Transform2D::scale(m_options.scale);

    const QString viewBoxText = attrs.value(QStringLiteral("viewBox"));
    if (!viewBoxText.isEmpty()) {
        std::optional<QVector<double>> viewBox = parseNumberList(viewBoxText);
        if (!viewBox || viewBox->size() != 4) {
            m_error = QStringLiteral("Invalid viewBox: \"%1\"").arg(viewBoxText);
            return false;
        }

        double vbX = (*viewBox)[0];
        double vbY = (*viewBox)[1];
        double vbW = (*viewBox)[2];
        double vbH = (*viewBox)[3];

        // Document scale from declared size; percentages keep 1.0
        double sx = 1.0;
        double sy = 1.0;
        const QString widthText = attrs.value(QStringLiteral("width"));
        const QString heightText = attrs.value(QStringLiteral("height"));
        std::optional<double> width = widthText.endsWith(QLatin1Char('%'))
                                          ? std::nullopt : parseLength(widthText);
        std::optional<double> height = heightText.endsWith(QLatin1Char('%'))
                                           ? std::nullopt : parseLength(heightText);
        if (width && vbW > 0) sx = *width / vbW;
        if (height && vbH > 0) sy = *height / vbH;
        if (width && !height) sy = sx;
        if (height && !width) sx = sy;

        root = root * Transform2D::scale(sx, sy) * Transform2D::translation(-vbX, -vbY);
        qCDebug(lcImport) << "SVG document scale" << sx << sy;
    }

    Frame frame;
    frame.transform = root;
    if (attrs.contains(QStringLiteral("fill"))) {
        frame.style.fill = attrs.value(QStringLiteral("fill"));
    }
    if (attrs.contains(QStringLiteral("stroke"))) {
        frame.style.stroke = attrs.value(QStringLiteral("stroke"));
    }
    if (attrs.contains(QStringLiteral("stroke-width"))) {
        frame.style.strokeWidth = attrs.value(QStringLiteral("stroke-width"));
    }
    m_stack.append(frame);
    return true;
}

void SVGWalker::addShape(const QVector<QPointF>& local, bool closed,
                         const Frame& frame, bool isPath)
{
    QVector<QPointF> absolute = frame.transform.apply(local);
    if (absolute.size() < 2) {
        qCDebug(lcImport) << "Skipping degenerate SVG shape";
        return;
    }

    Polyline poly = Polyline::fromAbsolute(absolute, closed);

    const Style& style = frame.style;
    if (isPaint(style.stroke)) {
        poly.strokeColor = *style.stroke;
    } else if (isPaint(style.fill)) {
        poly.strokeColor = *style.fill;
    }

    double width = 0.0;
    if (style.strokeWidth) {
        width = parseLength(*style.strokeWidth).value_or(0.0);
    }
    if (!isPath && !(width > 0.0)) {
        width = 2.0;
    }
    poly.strokeWidth = qMax(0.0, width);

    if (isPaint(style.fill)) {
        poly.fillColor = *style.fill;
    }

    m_polylines.append(poly);
}

bool SVGWalker::handleShape(const QString& tag, const AttributeMap& attrs, const Frame& frame)
{
    if (tag == QLatin1String("path")) {
        if (!isPaint(frame.style.fill)) {
            qCDebug(lcImport) << "Dropping unfilled path";
            return true;
        }

        bool ok = true;
        QVector<SVGSubpath> subpaths = parseSVGPathData(attrs.value(QStringLiteral("d")), &ok);
        if (!ok) {
            m_error = QStringLiteral("Malformed path data");
            return false;
        }

        for (const SVGSubpath& sub : subpaths) {
            QVector<QPointF> sampled = geometry::sampleContour(sub.segments);
            addShape(sampled, sub.closed, frame, true);
        }
        return true;
    }

    if (tag == QLatin1String("rect")) {
        double x, y, w, h;
        if (!number(attrs, QStringLiteral("x"), x) || !number(attrs, QStringLiteral("y"), y) ||
            !number(attrs, QStringLiteral("width"), w) ||
            !number(attrs, QStringLiteral("height"), h)) {
            return false;
        }
        if (!(w > 0.0) || !(h > 0.0)) {
            qCDebug(lcImport) << "Skipping zero-size rect";
            return true;
        }
        addShape({QPointF(x, y), QPointF(x + w, y), QPointF(x + w, y + h),
                  QPointF(x, y + h), QPointF(x, y)}, true, frame, false);
        return true;
    }

    if (tag == QLatin1String("circle") || tag == QLatin1String("ellipse")) {
        double cx, cy, rx, ry;
        if (!number(attrs, QStringLiteral("cx"), cx) || !number(attrs, QStringLiteral("cy"), cy)) {
            return false;
        }
        if (tag == QLatin1String("circle")) {
            if (!number(attrs, QStringLiteral("r"), rx)) return false;
            ry = rx;
        } else if (!number(attrs, QStringLiteral("rx"), rx) ||
                   !number(attrs, QStringLiteral("ry"), ry)) {
            return false;
        }
        addShape(geometry::sampleEllipse(QPointF(cx, cy), rx, ry), true, frame, false);
        return true;
    }

    if (tag == QLatin1String("line")) {
        double x1, y1, x2, y2;
        if (!number(attrs, QStringLiteral("x1"), x1) || !number(attrs, QStringLiteral("y1"), y1) ||
            !number(attrs, QStringLiteral("x2"), x2) || !number(attrs, QStringLiteral("y2"), y2)) {
            return false;
        }
        addShape({QPointF(x1, y1), QPointF(x2, y2)}, false, frame, false);
        return true;
    }

    if (tag == QLatin1String("polyline") || tag == QLatin1String("polygon")) {
        const QString text = attrs.value(QStringLiteral("points"));
        std::optional<QVector<double>> values = parseNumberList(text);
        if (!values) {
            m_error = QStringLiteral("Invalid points attribute: \"%1\"").arg(text);
            return false;
        }

        QVector<QPointF> points;
        for (int i = 0; i + 1 < values->size(); i += 2) {
            points.append(QPointF((*values)[i], (*values)[i + 1]));
        }

        bool closed = tag == QLatin1String("polygon");
        if (closed && points.size() >= 2 && points.first() != points.last()) {
            points.append(points.first());
        }
        addShape(points, closed, frame, false);
        return true;
    }

    return true;
}

ImportResult SVGWalker::run(const QString& content)
{
    QXmlStreamReader reader(content);
    bool sawRoot = false;

    while (!reader.atEnd()) {
        QXmlStreamReader::TokenType token = reader.readNext();

        if (token == QXmlStreamReader::EndElement) {
            if (!m_stack.isEmpty()) m_stack.removeLast();
            continue;
        }
        if (token != QXmlStreamReader::StartElement) {
            continue;
        }

        const QString tag = reader.name().toString();
        AttributeMap attrs = collectAttributes(reader.attributes());

        if (!sawRoot) {
            sawRoot = true;
            if (tag != QLatin1String("svg")) {
                return importFailure(QStringLiteral("Not an SVG document (root element <%1>)").arg(tag));
            }
            if (!handleRoot(attrs)) {
                return importFailure(m_error);
            }
            continue;
        }

        if (skippedTags().contains(tag)) {
            reader.skipCurrentElement();
            continue;
        }
        if (unsupportedTags().contains(tag)) {
            m_result.addWarning(tag);
            reader.skipCurrentElement();
            continue;
        }

        Frame frame = m_stack.isEmpty() ? Frame() : m_stack.last();

        if (attrs.contains(QStringLiteral("fill"))) {
            frame.style.fill = attrs.value(QStringLiteral("fill"));
        }
        if (attrs.contains(QStringLiteral("stroke"))) {
            frame.style.stroke = attrs.value(QStringLiteral("stroke"));
        }
        if (attrs.contains(QStringLiteral("stroke-width"))) {
            frame.style.strokeWidth = attrs.value(QStringLiteral("stroke-width"));
        }

        const QString transformText = attrs.value(QStringLiteral("transform"));
        if (!transformText.isEmpty()) {
            std::optional<Transform2D> local = parseSVGTransform(transformText);
            if (!local) {
                return importFailure(QStringLiteral("Invalid transform: \"%1\"").arg(transformText));
            }
            frame.transform = frame.transform * *local;
        }

        m_stack.append(frame);

        if (!handleShape(tag, attrs, frame)) {
            return importFailure(QStringLiteral("%1 (line %2)")
                                     .arg(m_error).arg(reader.lineNumber()));
        }
    }

    if (reader.hasError()) {
        return importFailure(QStringLiteral("XML error at line %1: %2")
                                 .arg(reader.lineNumber()).arg(reader.errorString()));
    }
    if (!sawRoot) {
        return importFailure(QStringLiteral("Empty SVG document"));
    }

    ImportResult result = normalizeShapes(m_polylines,
                                          QStringLiteral("SVG contains no importable shapes"));
    result.warnings = m_result.warnings;
    return result;
}

}  // anonymous namespace

// =====================================================================
//  Path data
// =====================================================================

QVector<SVGSubpath> parseSVGPathData(const QString& svgPathData, bool* ok)
{
    QVector<SVGSubpath> subpaths;
    SVGSubpath current;
    QPointF currentPoint(0, 0);
    QPointF startPoint(0, 0);
    QPointF lastCubicControl;
    QPointF lastQuadControl;
    QChar previous;
    bool good = true;

    auto flush = [&]() {
        if (!current.segments.isEmpty()) {
            subpaths.append(current);
        }
        current = SVGSubpath();
    };

    int pos = 0;
    QChar lastCommand;

    while (good) {
        skipSeparators(svgPathData, pos);
        if (pos >= svgPathData.length()) break;

        QChar cmd = svgPathData[pos];
        if (cmd.isLetter()) {
            ++pos;
        } else if (!lastCommand.isNull() && numberFollows(svgPathData, pos)) {
            // Implicit repeat of the previous command
            cmd = lastCommand;
        } else {
            good = false;
            break;
        }

        bool relative = cmd.isLower();
        QChar cmdUpper = cmd.toUpper();
        QPointF base = relative ? currentPoint : QPointF(0, 0);
        lastCommand = cmd;

        if (cmdUpper == 'M') {
            flush();
            double x = parseNumber(svgPathData, pos, good);
            double y = parseNumber(svgPathData, pos, good);
            currentPoint = base + QPointF(x, y);
            startPoint = currentPoint;
            lastCommand = relative ? 'l' : 'L';  // Subsequent pairs are LineTo

        } else if (cmdUpper == 'L') {
            double x = parseNumber(svgPathData, pos, good);
            double y = parseNumber(svgPathData, pos, good);
            QPointF p = base + QPointF(x, y);
            current.segments.append(PathSegment::line(currentPoint, p));
            currentPoint = p;

        } else if (cmdUpper == 'H') {
            double x = parseNumber(svgPathData, pos, good);
            QPointF p(relative ? currentPoint.x() + x : x, currentPoint.y());
            current.segments.append(PathSegment::line(currentPoint, p));
            currentPoint = p;

        } else if (cmdUpper == 'V') {
            double y = parseNumber(svgPathData, pos, good);
            QPointF p(currentPoint.x(), relative ? currentPoint.y() + y : y);
            current.segments.append(PathSegment::line(currentPoint, p));
            currentPoint = p;

        } else if (cmdUpper == 'C' || cmdUpper == 'S') {
            QPointF p1;
            if (cmdUpper == 'C') {
                double x1 = parseNumber(svgPathData, pos, good);
                double y1 = parseNumber(svgPathData, pos, good);
                p1 = base + QPointF(x1, y1);
            } else {
                // First control point is the reflection of the last one
                bool chained = previous == 'C' || previous == 'S';
                p1 = chained ? currentPoint * 2 - lastCubicControl : currentPoint;
            }
            double x2 = parseNumber(svgPathData, pos, good);
            double y2 = parseNumber(svgPathData, pos, good);
            double x = parseNumber(svgPathData, pos, good);
            double y = parseNumber(svgPathData, pos, good);
            QPointF p2 = base + QPointF(x2, y2);
            QPointF p3 = base + QPointF(x, y);

            current.segments.append(PathSegment::cubic(currentPoint, p1, p2, p3));
            lastCubicControl = p2;
            currentPoint = p3;

        } else if (cmdUpper == 'Q' || cmdUpper == 'T') {
            QPointF p1;
            if (cmdUpper == 'Q') {
                double x1 = parseNumber(svgPathData, pos, good);
                double y1 = parseNumber(svgPathData, pos, good);
                p1 = base + QPointF(x1, y1);
            } else {
                bool chained = previous == 'Q' || previous == 'T';
                p1 = chained ? currentPoint * 2 - lastQuadControl : currentPoint;
            }
            double x = parseNumber(svgPathData, pos, good);
            double y = parseNumber(svgPathData, pos, good);
            QPointF p2 = base + QPointF(x, y);

            current.segments.append(PathSegment::quadratic(currentPoint, p1, p2));
            lastQuadControl = p1;
            currentPoint = p2;

        } else if (cmdUpper == 'A') {
            double rx = parseNumber(svgPathData, pos, good);
            double ry = parseNumber(svgPathData, pos, good);
            double xAxisRotation = parseNumber(svgPathData, pos, good);
            bool largeArc = parseFlag(svgPathData, pos, good);
            bool sweep = parseFlag(svgPathData, pos, good);
            double x = parseNumber(svgPathData, pos, good);
            double y = parseNumber(svgPathData, pos, good);
            QPointF endPoint = base + QPointF(x, y);

            std::optional<geometry::EllipticalArc> arc = geometry::svgArcToCenter(
                currentPoint, rx, ry, xAxisRotation, largeArc, sweep, endPoint);
            if (arc) {
                current.segments.append(PathSegment::ellipticalArc(*arc));
            } else if (currentPoint != endPoint) {
                current.segments.append(PathSegment::line(currentPoint, endPoint));
            }
            currentPoint = endPoint;

        } else if (cmdUpper == 'Z') {
            if (geometry::distance(currentPoint, startPoint) > geometry::DEFAULT_TOLERANCE) {
                current.segments.append(PathSegment::line(currentPoint, startPoint));
            }
            current.closed = true;
            flush();
            currentPoint = startPoint;
            lastCommand = QChar();

        } else {
            good = false;
        }

        previous = cmdUpper;
    }

    flush();

    if (ok) {
        *ok = good;
    }
    return good ? subpaths : QVector<SVGSubpath>();
}

// =====================================================================
//  Transform lists
// =====================================================================

std::optional<Transform2D> parseSVGTransform(const QString& text)
{
    static const QRegularExpression itemRe(
        QStringLiteral("\\s*(matrix|translate|scale|rotate|skewX|skewY)\\s*\\(([^)]*)\\)\\s*,?"));

    Transform2D result;
    int pos = 0;
    while (pos < text.length()) {
        QRegularExpressionMatch match = itemRe.match(text, pos,
            QRegularExpression::NormalMatch, QRegularExpression::AnchorAtOffsetMatchOption);
        if (!match.hasMatch()) {
            if (text.mid(pos).trimmed().isEmpty()) break;
            return std::nullopt;
        }
        pos = match.capturedEnd();

        const QString name = match.captured(1);
        std::optional<QVector<double>> args = parseNumberList(match.captured(2));
        if (!args) {
            return std::nullopt;
        }
        const QVector<double>& a = *args;

        Transform2D t;
        if (name == QLatin1String("matrix")) {
            if (a.size() != 6) return std::nullopt;
            t = Transform2D::fromMatrix(a[0], a[1], a[2], a[3], a[4], a[5]);
        } else if (name == QLatin1String("translate")) {
            if (a.size() != 1 && a.size() != 2) return std::nullopt;
            t = Transform2D::translation(a[0], a.size() > 1 ? a[1] : 0.0);
        } else if (name == QLatin1String("scale")) {
            if (a.size() != 1 && a.size() != 2) return std::nullopt;
            t = Transform2D::scale(a[0], a.size() > 1 ? a[1] : a[0]);
        } else if (name == QLatin1String("rotate")) {
            if (a.size() == 1) {
                t = Transform2D::rotation(a[0]);
            } else if (a.size() == 3) {
                t = Transform2D::rotation(a[0], QPointF(a[1], a[2]));
            } else {
                return std::nullopt;
            }
        } else if (name == QLatin1String("skewX")) {
            if (a.size() != 1) return std::nullopt;
            t = Transform2D::skewX(a[0]);
        } else {
            if (a.size() != 1) return std::nullopt;
            t = Transform2D::skewY(a[0]);
        }

        result = result * t;
    }
    return result;
}

// =====================================================================
//  Entry points
// =====================================================================

ImportResult importSVGString(const QString& svgContent, const SVGImportOptions& options)
{
    if (svgContent.trimmed().isEmpty()) {
        return importFailure(QStringLiteral("Empty SVG content"));
    }

    SVGWalker walker(options);
    ImportResult result = walker.run(svgContent);

    if (result.status == ImportStatus::ParseError) {
        qCWarning(lcImport) << "SVG import failed:" << result.errorMessage;
    } else {
        qCDebug(lcImport) << "SVG import produced" << result.shapes.size() << "records";
    }
    return result;
}

ImportResult importSVGFile(const QString& filePath, const SVGImportOptions& options)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return importFailure(QStringLiteral("Cannot open file: %1").arg(filePath));
    }

    QString content = QString::fromUtf8(file.readAll());
    file.close();

    return importSVGString(content, options);
}

}  // namespace importer
}  // namespace lasercam
