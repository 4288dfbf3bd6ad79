// jnx: patch one value of a JSON file in place, keeping the rest of the
// file byte-for-byte.
//
//   jnx --path '["servers",0,"port"]' --value 8080 config.json
//   jnx --path '["name"]' --value '"demo"' --in-place package.json
//   jnx --path '[]' --value '{"a":1}' doc.json       (rewrites the whole file)

#include "core.h"
#include "document.h"
#include "jsonsyntax.h"
#include "patcher.h"
#include "settings.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonArray>
#include <QTextStream>
#include <cstdio>

using namespace jnx;

enum ExitCode {
    ExitOk        = 0,
    ExitUsage     = 1,
    ExitBadValue  = 2,
    ExitBadPath   = 3,
};

static std::optional<JsonPath> parsePathArg(const QString& text, QString* error) {
    auto r = JsonSyntax::parse(text);
    if (!r.ok) {
        *error = QStringLiteral("%1 at position %2").arg(r.error).arg(r.errorPos);
        return std::nullopt;
    }
    QJsonValue v = JsonSyntax::toValue(r.root);
    if (!v.isArray()) {
        *error = QStringLiteral("path must be a JSON array");
        return std::nullopt;
    }
    auto path = pathFromJson(v.toArray());
    if (!path)
        *error = QStringLiteral("path segments must be strings or non-negative integers");
    return path;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("jnx");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Set one value inside a JSON document without reformatting it.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", "JSON document to patch.");

    QCommandLineOption pathOpt({"p", "path"}, "Target path as a JSON array, e.g. [\"a\",0].", "path");
    QCommandLineOption valueOpt({"v", "value"}, "New value as JSON text.", "json");
    QCommandLineOption inPlaceOpt({"i", "in-place"}, "Write the result back to the file.");
    QCommandLineOption indentOpt("indent", "Indent width for new structure.", "n");
    QCommandLineOption printPathOpt("print-path", "Print the display form of the path and exit.");
    parser.addOptions({pathOpt, valueOpt, inPlaceOpt, indentOpt, printPathOpt});
    parser.process(app);

    QTextStream err(stderr);
    QTextStream out(stdout);

    if (!parser.isSet(pathOpt)) {
        err << "jnx: --path is required\n";
        return ExitUsage;
    }
    QString pathError;
    auto path = parsePathArg(parser.value(pathOpt), &pathError);
    if (!path) {
        err << "jnx: invalid --path: " << pathError << "\n";
        return ExitUsage;
    }
    if (parser.isSet(printPathOpt)) {
        out << fmt::formatPath(*path) << "\n";
        return ExitOk;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1 || !parser.isSet(valueOpt)) {
        err << "jnx: expected --value and exactly one file\n";
        return ExitUsage;
    }

    EditorSettings settings = EditorSettings::load();
    if (parser.isSet(indentOpt)) {
        bool ok = false;
        int width = parser.value(indentOpt).toInt(&ok);
        if (!ok || width < 1) {
            err << "jnx: invalid --indent\n";
            return ExitUsage;
        }
        settings.indentWidth = width;
    }

    auto value = JsonSyntax::parse(parser.value(valueOpt));
    if (!value.ok) {
        err << "jnx: invalid --value: " << value.error << " at position " << value.errorPos << "\n";
        return ExitBadValue;
    }

    DocumentStore doc;
    if (!doc.load(args.first())) {
        err << "jnx: cannot read " << args.first() << "\n";
        return ExitUsage;
    }

    PatchResult r = JsonPatcher::setValue(doc.text(), *path,
                                          value.root,
                                          settings.formatOptions());
    if (!r.ok) {
        err << "jnx: " << fmt::formatPath(*path) << ": " << r.error << "\n";
        return ExitBadPath;
    }

    if (parser.isSet(inPlaceOpt)) {
        doc.setText(r.text, true);
        if (!doc.save(doc.filePath)) {
            err << "jnx: cannot write " << doc.filePath << "\n";
            return ExitUsage;
        }
        return ExitOk;
    }

    out << r.text;
    if (!r.text.endsWith('\n')) out << "\n";
    return ExitOk;
}
