#include "core/shared/stopwords.h"

namespace dq {

const QSet<QString>& englishStopwords()
{
    // Built once, lives for the process lifetime.
    static const QSet<QString> words = {
        QStringLiteral("i"), QStringLiteral("me"), QStringLiteral("my"),
        QStringLiteral("myself"), QStringLiteral("we"), QStringLiteral("our"),
        QStringLiteral("ours"), QStringLiteral("ourselves"), QStringLiteral("you"),
        QStringLiteral("you're"), QStringLiteral("you've"), QStringLiteral("you'll"),
        QStringLiteral("you'd"), QStringLiteral("your"), QStringLiteral("yours"),
        QStringLiteral("yourself"), QStringLiteral("yourselves"), QStringLiteral("he"),
        QStringLiteral("him"), QStringLiteral("his"), QStringLiteral("himself"),
        QStringLiteral("she"), QStringLiteral("she's"), QStringLiteral("her"),
        QStringLiteral("hers"), QStringLiteral("herself"), QStringLiteral("it"),
        QStringLiteral("it's"), QStringLiteral("its"), QStringLiteral("itself"),
        QStringLiteral("they"), QStringLiteral("them"), QStringLiteral("their"),
        QStringLiteral("theirs"), QStringLiteral("themselves"), QStringLiteral("what"),
        QStringLiteral("which"), QStringLiteral("who"), QStringLiteral("whom"),
        QStringLiteral("this"), QStringLiteral("that"), QStringLiteral("that'll"),
        QStringLiteral("these"), QStringLiteral("those"), QStringLiteral("am"),
        QStringLiteral("is"), QStringLiteral("are"), QStringLiteral("was"),
        QStringLiteral("were"), QStringLiteral("be"), QStringLiteral("been"),
        QStringLiteral("being"), QStringLiteral("have"), QStringLiteral("has"),
        QStringLiteral("had"), QStringLiteral("having"), QStringLiteral("do"),
        QStringLiteral("does"), QStringLiteral("did"), QStringLiteral("doing"),
        QStringLiteral("a"), QStringLiteral("an"), QStringLiteral("the"),
        QStringLiteral("and"), QStringLiteral("but"), QStringLiteral("if"),
        QStringLiteral("or"), QStringLiteral("because"), QStringLiteral("as"),
        QStringLiteral("until"), QStringLiteral("while"), QStringLiteral("of"),
        QStringLiteral("at"), QStringLiteral("by"), QStringLiteral("for"),
        QStringLiteral("with"), QStringLiteral("about"), QStringLiteral("against"),
        QStringLiteral("between"), QStringLiteral("into"), QStringLiteral("through"),
        QStringLiteral("during"), QStringLiteral("before"), QStringLiteral("after"),
        QStringLiteral("above"), QStringLiteral("below"), QStringLiteral("to"),
        QStringLiteral("from"), QStringLiteral("up"), QStringLiteral("down"),
        QStringLiteral("in"), QStringLiteral("out"), QStringLiteral("on"),
        QStringLiteral("off"), QStringLiteral("over"), QStringLiteral("under"),
        QStringLiteral("again"), QStringLiteral("further"), QStringLiteral("then"),
        QStringLiteral("once"), QStringLiteral("here"), QStringLiteral("there"),
        QStringLiteral("when"), QStringLiteral("where"), QStringLiteral("why"),
        QStringLiteral("how"), QStringLiteral("all"), QStringLiteral("any"),
        QStringLiteral("both"), QStringLiteral("each"), QStringLiteral("few"),
        QStringLiteral("more"), QStringLiteral("most"), QStringLiteral("other"),
        QStringLiteral("some"), QStringLiteral("such"), QStringLiteral("no"),
        QStringLiteral("nor"), QStringLiteral("not"), QStringLiteral("only"),
        QStringLiteral("own"), QStringLiteral("same"), QStringLiteral("so"),
        QStringLiteral("than"), QStringLiteral("too"), QStringLiteral("very"),
        QStringLiteral("s"), QStringLiteral("t"), QStringLiteral("can"),
        QStringLiteral("will"), QStringLiteral("just"), QStringLiteral("don"),
        QStringLiteral("don't"), QStringLiteral("should"), QStringLiteral("should've"),
        QStringLiteral("now"), QStringLiteral("d"), QStringLiteral("ll"), QStringLiteral("m"),
        QStringLiteral("o"), QStringLiteral("re"), QStringLiteral("ve"), QStringLiteral("y"),
        QStringLiteral("ain"), QStringLiteral("aren"), QStringLiteral("aren't"),
        QStringLiteral("couldn"), QStringLiteral("couldn't"), QStringLiteral("didn"),
        QStringLiteral("didn't"), QStringLiteral("doesn"), QStringLiteral("doesn't"),
        QStringLiteral("hadn"), QStringLiteral("hadn't"), QStringLiteral("hasn"),
        QStringLiteral("hasn't"), QStringLiteral("haven"), QStringLiteral("haven't"),
        QStringLiteral("isn"), QStringLiteral("isn't"), QStringLiteral("ma"),
        QStringLiteral("mightn"), QStringLiteral("mightn't"), QStringLiteral("mustn"),
        QStringLiteral("mustn't"), QStringLiteral("needn"), QStringLiteral("needn't"),
        QStringLiteral("shan"), QStringLiteral("shan't"), QStringLiteral("shouldn"),
        QStringLiteral("shouldn't"), QStringLiteral("wasn"), QStringLiteral("wasn't"),
        QStringLiteral("weren"), QStringLiteral("weren't"), QStringLiteral("won"),
        QStringLiteral("won't"), QStringLiteral("wouldn"), QStringLiteral("wouldn't"),
    };
    return words;
}

bool isStopword(const QString& lowerCaseToken)
{
    return englishStopwords().contains(lowerCaseToken);
}

} // namespace dq
