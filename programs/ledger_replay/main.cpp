/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <iostream>
#include <string>
#include <vector>

#include <fc/io/fstream.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <apogee/chain/database.hpp>
#include <apogee/chain/genesis_state.hpp>
#include <apogee/chain/protocol/protocol.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace apogee::chain;
using namespace std;
namespace bpo = boost::program_options;

namespace apogee { namespace replay {

   /** one entry of the calls file */
   struct replay_call
   {
      address     caller;
      uint32_t    height = 0;
      operation   op;
   };

} } // apogee::replay

FC_REFLECT( apogee::replay::replay_call, (caller)(height)(op) )

using apogee::replay::replay_call;

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description cli_options("Apogee ledger replay");
      cli_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json,g", bpo::value<boost::filesystem::path>(), "File to read genesis state from")
            ("calls-json,c", bpo::value<boost::filesystem::path>(), "File to read the list of calls from")
            ("out,o", bpo::value<boost::filesystem::path>(), "File to write the final ledger state to")
            ("print-events", "Print every published event to stdout")
            ;

      bpo::variables_map options;
      try
      {
         boost::program_options::store( boost::program_options::parse_command_line(argc, argv, cli_options), options );
      }
      catch (const boost::program_options::error& e)
      {
         std::cerr << "ledger_replay:  error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") )
      {
         std::cout << cli_options << "\n";
         return 0;
      }

      if( !options.count( "genesis-json" ) )
      {
         std::cerr << "--genesis-json option is required\n";
         return 1;
      }

      fc::path genesis_json_filename = options["genesis-json"].as<boost::filesystem::path>();
      std::cerr << "ledger_replay:  Reading genesis from file " << genesis_json_filename.preferred_string() << "\n";
      std::string genesis_json;
      read_file_contents( genesis_json_filename, genesis_json );
      genesis_state_type genesis = fc::json::from_string( genesis_json ).as< genesis_state_type >();

      vector<replay_call> calls;
      if( options.count( "calls-json" ) )
      {
         fc::path calls_json_filename = options["calls-json"].as<boost::filesystem::path>();
         std::cerr << "ledger_replay:  Reading calls from file " << calls_json_filename.preferred_string() << "\n";
         std::string calls_json;
         read_file_contents( calls_json_filename, calls_json );
         calls = fc::json::from_string( calls_json ).as< vector<replay_call> >();
      }

      database db;
      if( options.count( "print-events" ) )
      {
         db.applied_event.connect( []( const ledger_event& e )
         {
            std::cout << fc::json::to_string( e ) << "\n";
         } );
      }
      db.init_genesis( genesis );

      uint32_t failed = 0;
      for( size_t i = 0; i < calls.size(); ++i )
      {
         const replay_call& call = calls[i];
         try
         {
            db.apply_operation( call_context( call.caller, call.height ), call.op );
         }
         catch( const ledger_exception& e )
         {
            ++failed;
            std::cerr << "ledger_replay:  call " << i << " failed: " << e.to_string() << "\n";
         }
      }
      ilog( "Replayed ${n} calls, ${f} failed", ("n", calls.size())("f", failed) );

      if( options.count( "out" ) )
      {
         fc::path output_filename = options["out"].as<boost::filesystem::path>();
         fc::json::save_to_file( db.get_snapshot(), output_filename );
      }

      return failed == 0 ? 0 : 2;
   }
   catch ( const fc::exception& e )
   {
      std::cout << e.to_detail_string() << "\n";
      return 1;
   }
}
