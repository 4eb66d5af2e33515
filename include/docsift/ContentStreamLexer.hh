// Copyright (c) 2026 The docsift authors
//
// This file is part of docsift.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef CONTENTSTREAMLEXER_HH
#define CONTENTSTREAMLEXER_HH

#include <docsift/DLL.h>

#include <string>
#include <vector>

// A forgiving scanner that recovers the operands of the simple text-showing operators from raw
// content stream data. It is used when a page's content can't be interpreted properly, so it
// never fails: malformed input yields whatever strings could be recognized. It knows nothing
// about fonts or positioning.
class ContentStreamLexer
{
  public:
    class Token
    {
      public:
        Token() = default;
        Token(std::string const& op, std::vector<std::string> const& strings) :
            op(op),
            strings(strings)
        {
        }
        // "Tj", "'", "\"" or "TJ"
        std::string const&
        getOperator() const
        {
            return op;
        }
        // The raw bytes of each string operand. A TJ array contributes one entry per string in
        // the array; the other operators contribute exactly one.
        std::vector<std::string> const&
        getStrings() const
        {
            return strings;
        }
        // All strings concatenated
        DOCSIFT_DLL
        std::string getBytes() const;

      private:
        std::string op;
        std::vector<std::string> strings;
    };

    DOCSIFT_DLL
    ContentStreamLexer(std::string const& data);

    // Read the next text-showing token. Returns false at the end of the data.
    DOCSIFT_DLL
    bool nextToken(Token& token);

    // Return all text-showing tokens in the data in order.
    DOCSIFT_DLL
    static std::vector<Token> tokenize(std::string const& data);

  private:
    bool atEnd() const;
    void skipSpace();
    void skipComment();
    void skipInlineImageData();
    bool atWord(char const* word) const;
    std::string readLiteralString();
    std::string readHexString();
    std::vector<std::string> readArray();
    std::string readOperator();

    std::string data;
    size_t pos{0};
};

#endif // CONTENTSTREAMLEXER_HH
