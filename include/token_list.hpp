// X(kind, string, is keyword)
X(Insert, "insert", true)
X(Select, "select", true)
X(Number, "number", false)
X(Word, "word", false)
X(String, "string", false)
X(Unexpected, "unexpected", false)
X(End, "end", false)
